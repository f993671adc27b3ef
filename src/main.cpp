#include <iostream>
#include <algorithm>
#include <optional>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <memory>
#include <csignal>
#include <ctime>
#include <chrono>
#include <cstdlib>

#include "core/BackupEngine.hpp"
#include "core/EngineSettings.hpp"
#include "core/JobFile.hpp"
#include "core/ledger/Ledger.hpp"
#include "utils/ConfigManager.hpp"
#include "utils/ConsoleLogger.hpp"
#include "utils/FileLogger.hpp"
#include "utils/CompositeLogger.hpp"

// Ctrl-C / SIGTERM 只设置标志，由主线程挂起备份
static volatile std::sig_atomic_t interruptRequested = 0;

static void handleInterrupt(int) {
    interruptRequested = 1;
}

static std::string formatTime(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

// 用户界面抽象接口
class IUserInterface {
public:
    virtual ~IUserInterface() = default;

    virtual void initialize() = 0;

    // 返回进程退出码
    virtual int run() = 0;

    virtual void showHelp() = 0;

    virtual void showMessage(const std::string& message) = 0;

    virtual void showError(const std::string& message) = 0;

    virtual void showProgress(int processed, int total, const std::string& label) = 0;
};

// 控制器类 - 处理业务逻辑，与具体界面实现解耦合
class ApplicationController {
private:
    IUserInterface* ui;
    ILogger& logger;
    AppConfig config;
    std::unique_ptr<Ledger> ledger;
    std::unique_ptr<BackupEngine> engine;

public:
    ApplicationController(IUserInterface* ui, ILogger& logger, const AppConfig& config)
        : ui(ui), logger(logger), config(config) {}

    void setUserInterface(IUserInterface* ui) {
        this->ui = ui;
    }

    int start() {
        if (!ui) {
            return 1;
        }
        ui->initialize();
        return ui->run();
    }

    const AppConfig& getConfig() const {
        return config;
    }

    // 打开账本并创建引擎；上次异常退出时仍在运行的执行改为暂停
    bool open() {
        if (engine) {
            return true;
        }
        try {
            ledger = std::make_unique<Ledger>(config.databasePath);
        } catch (const LedgerError& e) {
            logger.error(std::string("Failed to open database: ") + e.what());
            return false;
        }
        engine = std::make_unique<BackupEngine>(*ledger, &logger, EngineSettings::fromConfig(config));
        engine->recoverInterruptedExecutions();
        return true;
    }

    bool importJob(const std::string& path) {
        Job job;
        std::string error;
        if (!JobFile::load(path, job, error)) {
            ui->showError(error);
            return false;
        }
        int64_t id = ledger->createJob(job);
        logger.info("Imported job " + job.name + " with id " + std::to_string(id));
        ui->showMessage("Created job " + std::to_string(id) + ": " + job.name);
        return true;
    }

    bool listJobs() {
        std::vector<Job> jobs = ledger->listJobs(true);
        if (jobs.empty()) {
            ui->showMessage("No backup jobs configured");
            return true;
        }
        for (const auto& job : jobs) {
            std::ostringstream line;
            line << std::setw(4) << job.id << "  " << job.name << "  [" << job.destinationType << ", "
                 << toString(job.conflictPolicy) << "]  " << job.sources.size() << " source(s)";
            auto active = ledger->findActiveExecution(job.id);
            if (active) {
                line << "  (" << toString(active->status) << " execution " << active->id << ")";
            }
            ui->showMessage(line.str());
        }
        return true;
    }

    bool runJob(int64_t jobId) {
        bool finished = false;
        bool succeeded = false;
        engine->setProgressCallback([this](int processed, int total, const std::string& label) {
            ui->showProgress(processed, total, label);
        });
        engine->setLogCallback([this](const std::string& message) {
            ui->showMessage(message);
        });
        engine->setCompletionCallback([&finished, &succeeded](bool success, const std::string&) {
            finished = true;
            succeeded = success;
        });

        if (!engine->startJob(jobId)) {
            ui->showError("Backup could not be started");
            return false;
        }

        bool suspendRequested = false;
        while (!engine->waitForIdle(std::chrono::milliseconds(200))) {
            if (interruptRequested && !suspendRequested) {
                ui->showMessage("Interrupt received, pausing backup after the current file...");
                engine->suspend();
                suspendRequested = true;
            }
        }

        engine->setCompletionCallback(nullptr);

        std::optional<ExecutionOutcome> outcome = engine->lastOutcome();
        if (outcome && outcome->status == ExecutionStatus::PAUSED) {
            ui->showMessage("Execution " + std::to_string(outcome->executionId) +
                            " paused; run the job again to resume");
        }
        return finished && succeeded;
    }

    bool listPaused() {
        std::vector<Execution> paused = engine->listPausedExecutions();
        if (paused.empty()) {
            ui->showMessage("No paused executions");
            return true;
        }
        for (const auto& execution : paused) {
            std::ostringstream line;
            line << "execution " << execution.id << "  job " << execution.jobId << "  "
                 << execution.processedFiles << "/" << execution.totalFiles << " files ("
                 << execution.progressPercentage() << "%)";
            if (execution.pausedAt) {
                line << "  paused at " << formatTime(*execution.pausedAt);
            }
            ui->showMessage(line.str());
        }
        return true;
    }

    bool showHistory(int64_t jobId) {
        if (!ledger->getJob(jobId)) {
            ui->showError("Job " + std::to_string(jobId) + " not found");
            return false;
        }
        std::vector<Execution> executions = ledger->listExecutions(jobId);
        if (executions.empty()) {
            ui->showMessage("No executions recorded for job " + std::to_string(jobId));
            return true;
        }
        for (const auto& execution : executions) {
            std::ostringstream line;
            line << std::setw(4) << execution.id << "  " << formatTime(execution.startedAt) << "  "
                 << std::left << std::setw(22) << toString(execution.status) << std::right
                 << execution.processedFiles << "/" << execution.totalFiles << " files, "
                 << execution.failedFiles << " failed, " << std::fixed << std::setprecision(2)
                 << execution.transferRateMBps() << " MB/s";
            if (!execution.errorMessage.empty()) {
                line << "  (" << execution.errorMessage << ")";
            }
            ui->showMessage(line.str());
        }
        return true;
    }

    bool deleteJob(int64_t jobId) {
        if (!ledger->softDeleteJob(jobId)) {
            ui->showError("Job " + std::to_string(jobId) + " not found");
            return false;
        }
        logger.info("Deactivated job " + std::to_string(jobId));
        ui->showMessage("Job " + std::to_string(jobId) + " deleted");
        return true;
    }

    bool purge(int days) {
        int removed = engine->purgeTerminalExecutions(days);
        ui->showMessage("Removed " + std::to_string(removed) + " old executions");
        return true;
    }

    // 工作线程未能在超时内停下时返回false
    bool shutdown() {
        if (engine) {
            return engine->shutdown(std::chrono::milliseconds(config.shutdownTimeoutMs));
        }
        return true;
    }
};

// 命令行界面实现 - 作为IUserInterface的具体实现
class CommandLineInterface : public IUserInterface {
private:
    ApplicationController& controller;
    std::vector<std::string> args;

    static bool parseId(const std::string& text, int64_t& id) {
        try {
            size_t used = 0;
            long long value = std::stoll(text, &used);
            if (used != text.size() || value <= 0) {
                return false;
            }
            id = value;
            return true;
        } catch (const std::logic_error&) {
            return false;
        }
    }

    bool requireArgument(size_t index, const std::string& command) {
        if (index < args.size()) {
            return true;
        }
        showError("Missing argument for '" + command + "'");
        return false;
    }

public:
    CommandLineInterface(ApplicationController& controller, std::vector<std::string> args)
        : controller(controller), args(std::move(args)) {}

    void initialize() override {
        std::signal(SIGINT, handleInterrupt);
        std::signal(SIGTERM, handleInterrupt);
    }

    int run() override {
        if (args.empty() || args[0] == "-h" || args[0] == "--help") {
            showHelp();
            return args.empty() ? 1 : 0;
        }

        const std::string& command = args[0];
        if (command != "import-job" && command != "list-jobs" && command != "run" &&
            command != "list-paused" && command != "history" && command != "delete-job" &&
            command != "purge") {
            showError("Unknown command: " + command);
            showHelp();
            return 1;
        }

        bool ok = false;
        int64_t id = 0;
        try {
            if (!controller.open()) {
                return 1;
            }
            if (command == "import-job") {
                ok = requireArgument(1, command) && controller.importJob(args[1]);
            } else if (command == "list-jobs") {
                ok = controller.listJobs();
            } else if (command == "list-paused") {
                ok = controller.listPaused();
            } else if (command == "purge") {
                int days = controller.getConfig().retentionDays;
                if (args.size() > 1) {
                    int64_t parsed = 0;
                    if (!parseId(args[1], parsed)) {
                        showError("Invalid number of days: " + args[1]);
                        return 1;
                    }
                    days = static_cast<int>(parsed);
                }
                ok = controller.purge(days);
            } else {
                if (!requireArgument(1, command)) {
                    return 1;
                }
                if (!parseId(args[1], id)) {
                    showError("Invalid job id: " + args[1]);
                    return 1;
                }
                if (command == "run") {
                    ok = controller.runJob(id);
                } else if (command == "history") {
                    ok = controller.showHistory(id);
                } else {
                    ok = controller.deleteJob(id);
                }
            }
        } catch (const LedgerError& e) {
            showError(std::string("Database error: ") + e.what());
            ok = false;
        }

        if (!controller.shutdown()) {
            // 复制仍在进行，不等待它结束
            std::cout.flush();
            std::quick_exit(ok ? 0 : 1);
        }
        return ok ? 0 : 1;
    }

    void showHelp() override {
        std::cout << "=== BackupKeeper Help Information ===\n";
        std::cout << "Usage: backupkeeper [--config <file>] <command> [arguments]\n\n";
        std::cout << "Commands:\n";
        std::cout << "  import-job <file>   Create a job from a JSON job description\n";
        std::cout << "  list-jobs           List active jobs\n";
        std::cout << "  run <job-id>        Run a job, resuming its paused execution if there is one\n";
        std::cout << "                      (Ctrl-C pauses the backup so it can be resumed later)\n";
        std::cout << "  list-paused         List paused executions\n";
        std::cout << "  history <job-id>    Show the executions of a job\n";
        std::cout << "  delete-job <job-id> Deactivate a job, keeping its history\n";
        std::cout << "  purge [days]        Remove finished executions older than days (default from config)\n\n";
        std::cout << "Options:\n";
        std::cout << "  --config <file>     Configuration file (default: backupkeeper.json)\n";
        std::cout << "  -h, --help          Show this help information\n\n";
        std::cout << "Examples:\n";
        std::cout << "  backupkeeper import-job documents.json\n";
        std::cout << "  backupkeeper run 1\n";
        std::cout << "  backupkeeper --config /etc/backupkeeper.json purge 7\n";
    }

    void showMessage(const std::string& message) override {
        std::cout << message << std::endl;
    }

    void showError(const std::string& message) override {
        std::cerr << "Error: " << message << std::endl;
    }

    void showProgress(int processed, int total, const std::string& label) override {
        int percent = total > 0 ? std::min(100, processed * 100 / total) : 0;
        std::cout << "[" << std::setw(3) << percent << "%] " << processed << "/" << total << "  "
                  << label << std::endl;
    }
};

int main(int argc, char* argv[]) {
    std::string configFile = "backupkeeper.json";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --config requires a file" << std::endl;
                return 1;
            }
            configFile = argv[++i];
        } else {
            args.push_back(arg);
        }
    }

    AppConfig config;
    try {
        config = ConfigManager::loadOrDefault(configFile);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // 执行中的INFO及以上消息经日志回调输出，控制台日志只保留错误
    ConsoleLogger consoleLogger(LogLevel::ERROR_LEVEL);
    FileLogger fileLogger(config.logDirectory, config.maxLogFiles, config.logLevel);
    CompositeLogger logger;
    logger.addLogger(&consoleLogger);
    if (fileLogger.isOpen()) {
        logger.addLogger(&fileLogger);
    } else {
        consoleLogger.warn("Log file could not be opened in " + config.logDirectory);
    }

    ApplicationController controller(nullptr, logger, config);
    CommandLineInterface cli(controller, args);
    controller.setUserInterface(&cli);

    return controller.start();
}
