#pragma once
#include <memory>
#include <string>
#include "ITargetConnector.hpp"

class ILogger;

// 按作业的目标类型创建连接器；未知类型返回nullptr
class ConnectorFactory {
public:
    ConnectorFactory(size_t hashChunkSize = 8192, int renameMaxAttempts = 9999);
    virtual ~ConnectorFactory() = default;

    // logger由调用方持有，生命周期需覆盖返回的连接器
    virtual std::unique_ptr<ITargetConnector> create(const std::string& destinationType,
                                                     ILogger* logger) const;

protected:
    size_t hashChunkSize;
    int renameMaxAttempts;
};
