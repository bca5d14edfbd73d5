/**
 * @file test_helpers.h
 * @brief Fake strategies for exercising DataConnector without a backend
 */

#pragma once

#include <idp/dc/connection.h>
#include <idp/dc/exceptions.h>
#include <idp/dc/executable_query.h>
#include <idp/dc/strategies.h>

#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace test_helpers {

using namespace idp::dc;

class FakeConnectionProvider;

// ============================================================================
// Connection / provider
// ============================================================================

class FakeConnection : public IConnection {
public:
    explicit FakeConnection(FakeConnectionProvider* provider) : provider_(provider) {}

    bool isValid() const override { return !released_; }
    std::string getBackendType() const override { return "fake"; }
    void release() override;

private:
    FakeConnectionProvider* provider_;
    bool released_ = false;
};

class FakeConnectionProvider : public IConnectionProvider {
public:
    std::atomic<int> initializeCount{0};
    std::atomic<int> acquireCount{0};
    std::atomic<int> releaseCount{0};
    std::atomic<int> shutdownCount{0};

    std::atomic<bool> initializeResult{true};
    std::atomic<bool> failAcquire{false};

    bool initialize() override {
        initializeCount++;
        return initializeResult;
    }

    std::unique_ptr<IConnection> acquireGeneric() override {
        acquireCount++;
        if (failAcquire) {
            throw ConnectionException("fake backend unreachable");
        }
        return std::make_unique<FakeConnection>(this);
    }

    Stats getStats() const override {
        return Stats{0, static_cast<size_t>(acquireCount - releaseCount), 0};
    }

    void shutdown() override { shutdownCount++; }

    std::string getBackendType() const override { return "fake"; }
};

inline void FakeConnection::release() {
    if (!released_) {
        released_ = true;
        provider_->releaseCount++;
    }
}

// ============================================================================
// Query / result
// ============================================================================

class FakeRawResult : public IRawResult {
public:
    explicit FakeRawResult(AttributeMap attributes) : attributes_(std::move(attributes)) {}

    const AttributeMap& getAttributes() const { return attributes_; }

    std::string getBackendType() const override { return "fake"; }
    bool isEmpty() const override { return attributes_.empty(); }

private:
    AttributeMap attributes_;
};

using ExecuteFn = std::function<std::unique_ptr<IRawResult>(IConnection&, std::chrono::milliseconds)>;

class FakeQuery : public IExecutableQuery {
public:
    FakeQuery(std::string key, ExecuteFn execute)
        : key_(std::move(key)), execute_(std::move(execute)) {}

    std::string getResultCacheKey() const override { return key_; }

    std::unique_ptr<IRawResult> execute(IConnection& conn,
                                        std::chrono::milliseconds timeout) const override {
        return execute_(conn, timeout);
    }

private:
    std::string key_;
    ExecuteFn execute_;
};

/**
 * @brief Builds FakeQuery objects keyed by principal
 *
 * The query returns `attributes` unless `executeError` is set.
 */
class FakeQueryBuilder : public IQueryBuilder {
public:
    mutable std::atomic<int> buildCount{0};
    std::shared_ptr<std::atomic<int>> executeCount = std::make_shared<std::atomic<int>>(0);
    std::shared_ptr<std::atomic<long long>> lastTimeoutMs = std::make_shared<std::atomic<long long>>(-1);

    AttributeMap attributes;
    std::function<void()> executeError;
    std::function<void()> buildError;

    std::unique_ptr<IExecutableQuery> build(const ResolutionContext& context) const override {
        buildCount++;
        if (buildError) {
            buildError();
        }
        auto count = executeCount;
        auto timeoutMs = lastTimeoutMs;
        auto result = attributes;
        auto error = executeError;
        return std::make_unique<FakeQuery>(
            "uid=" + context.getPrincipal(),
            [count, timeoutMs, result, error](IConnection& conn, std::chrono::milliseconds timeout)
                -> std::unique_ptr<IRawResult> {
                (*count)++;
                *timeoutMs = timeout.count();
                if (!conn.isValid()) {
                    throw ExecutionException("connection not valid");
                }
                if (error) {
                    error();
                }
                return std::make_unique<FakeRawResult>(result);
            });
    }
};

class FakeResultMapper : public IResultMapper {
public:
    mutable std::atomic<int> mapCount{0};
    std::function<void()> mapError;

    AttributeMap map(const IRawResult& raw) const override {
        mapCount++;
        if (mapError) {
            mapError();
        }
        return resultCast<FakeRawResult>(raw).getAttributes();
    }
};

class FakeValidator : public IValidator {
public:
    mutable std::atomic<int> validateCount{0};
    std::atomic<bool> healthy{true};

    void validate() const override {
        validateCount++;
        if (!healthy) {
            throw ValidationException("fake backend unhealthy");
        }
    }
};

inline AttributeValues strings(std::initializer_list<const char*> values) {
    AttributeValues result;
    for (const char* v : values) {
        result.push_back(AttributeValue::ofString(v));
    }
    return result;
}

} // namespace test_helpers
