/**
 * @file test_data_connector.cpp
 * @brief Unit tests for the DataConnector lifecycle and retrieval pipeline
 *
 * Tests cover:
 * - Binding checks and the state machine
 * - Connection release on every exit path
 * - Fail-fast and degraded start-up
 * - No-result policy and result caching
 * - Wrapping of stray exceptions from strategies
 */

#include <gtest/gtest.h>
#include <idp/dc/data_connector.h>
#include <idp/dc/exceptions.h>

#include "test_helpers.h"

#include <thread>
#include <vector>

using namespace idp::dc;
using namespace test_helpers;

// ============================================================================
// Test Fixture
// ============================================================================

class DataConnectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider = std::make_shared<FakeConnectionProvider>();
        builder = std::make_shared<FakeQueryBuilder>();
        mapper = std::make_shared<FakeResultMapper>();
        validator = std::make_shared<FakeValidator>();

        builder->attributes["mail"] = strings({"alice@example.org"});
    }

    std::unique_ptr<DataConnector> makeConnector(ConnectorConfig config = ConnectorConfig()) {
        auto connector = std::make_unique<DataConnector>("test", config);
        connector->setConnectionProvider(provider);
        connector->setQueryBuilder(builder);
        connector->setResultMapper(mapper);
        connector->setValidator(validator);
        return connector;
    }

    std::shared_ptr<FakeConnectionProvider> provider;
    std::shared_ptr<FakeQueryBuilder> builder;
    std::shared_ptr<FakeResultMapper> mapper;
    std::shared_ptr<FakeValidator> validator;
};

// ============================================================================
// Bindings and state machine
// ============================================================================

TEST_F(DataConnectorTest, EmptyId_Throws) {
    EXPECT_THROW(DataConnector(""), ConfigurationException);
}

TEST_F(DataConnectorTest, InitializeWithoutProvider_ThrowsAndStaysUninitialized) {
    DataConnector connector("test");
    connector.setQueryBuilder(builder);
    connector.setResultMapper(mapper);

    EXPECT_THROW(connector.initialize(), ConfigurationException);
    EXPECT_EQ(connector.getState(), DataConnector::State::Uninitialized);

    // Binding the missing piece makes the connector usable
    connector.setConnectionProvider(provider);
    connector.initialize();
    EXPECT_EQ(connector.getState(), DataConnector::State::Ready);
}

TEST_F(DataConnectorTest, InitializeWithoutBuilderOrMapper_Throws) {
    DataConnector noBuilder("a");
    noBuilder.setConnectionProvider(provider);
    noBuilder.setResultMapper(mapper);
    EXPECT_THROW(noBuilder.initialize(), ConfigurationException);

    DataConnector noMapper("b");
    noMapper.setConnectionProvider(provider);
    noMapper.setQueryBuilder(builder);
    EXPECT_THROW(noMapper.initialize(), ConfigurationException);

    EXPECT_EQ(provider->initializeCount.load(), 0);
}

TEST_F(DataConnectorTest, Initialize_ReachesReadyAndValidated) {
    auto connector = makeConnector();

    connector->initialize();

    EXPECT_EQ(connector->getState(), DataConnector::State::Ready);
    EXPECT_TRUE(connector->isValidated());
    EXPECT_EQ(provider->initializeCount.load(), 1);
    EXPECT_EQ(validator->validateCount.load(), 1);
}

TEST_F(DataConnectorTest, InitializeTwice_ThrowsState) {
    auto connector = makeConnector();
    connector->initialize();

    EXPECT_THROW(connector->initialize(), StateException);
}

TEST_F(DataConnectorTest, SettersAfterInitialize_ThrowState) {
    auto connector = makeConnector();
    connector->initialize();

    EXPECT_THROW(connector->setConnectionProvider(provider), StateException);
    EXPECT_THROW(connector->setQueryBuilder(builder), StateException);
    EXPECT_THROW(connector->setResultMapper(mapper), StateException);
    EXPECT_THROW(connector->setValidator(validator), StateException);
    EXPECT_THROW(connector->setResultCache(std::make_shared<ResultCache>()), StateException);
    EXPECT_THROW(connector->setNoResultIsError(true), StateException);
    EXPECT_THROW(connector->setFailFastInitialize(true), StateException);
    EXPECT_THROW(connector->setQueryTimeout(std::chrono::milliseconds(10)), StateException);
    EXPECT_FALSE(connector->getConfig().noResultIsError);
}

TEST_F(DataConnectorTest, NegativeQueryTimeout_Throws) {
    DataConnector connector("test");
    EXPECT_THROW(connector.setQueryTimeout(std::chrono::milliseconds(-1)), ConfigurationException);
}

TEST_F(DataConnectorTest, RetrieveBeforeInitialize_ThrowsStateWithoutIo) {
    auto connector = makeConnector();

    EXPECT_THROW(connector->retrieveAttributes(ResolutionContext("alice")), StateException);
    EXPECT_EQ(builder->buildCount.load(), 0);
    EXPECT_EQ(provider->acquireCount.load(), 0);
}

TEST_F(DataConnectorTest, ProviderInitializeFailure_IsNotFatal) {
    provider->initializeResult = false;
    auto connector = makeConnector();

    connector->initialize();

    EXPECT_EQ(connector->getState(), DataConnector::State::Ready);
    EXPECT_TRUE(connector->isValidated());
}

// ============================================================================
// Destroy
// ============================================================================

TEST_F(DataConnectorTest, Destroy_ShutsProviderDownOnce) {
    auto connector = makeConnector();
    connector->initialize();

    connector->destroy();
    connector->destroy();

    EXPECT_EQ(connector->getState(), DataConnector::State::Destroyed);
    EXPECT_EQ(provider->shutdownCount.load(), 1);
    EXPECT_THROW(connector->retrieveAttributes(ResolutionContext("alice")), StateException);
    EXPECT_EQ(provider->acquireCount.load(), 0);
}

TEST_F(DataConnectorTest, DestroyUninitialized_DoesNotTouchProvider) {
    auto connector = makeConnector();

    connector->destroy();

    EXPECT_EQ(connector->getState(), DataConnector::State::Destroyed);
    EXPECT_EQ(provider->shutdownCount.load(), 0);
    EXPECT_THROW(connector->initialize(), StateException);
}

TEST_F(DataConnectorTest, Destructor_ShutsProviderDown) {
    {
        auto connector = makeConnector();
        connector->initialize();
    }
    EXPECT_EQ(provider->shutdownCount.load(), 1);
}

// ============================================================================
// Retrieval
// ============================================================================

TEST_F(DataConnectorTest, Retrieve_ReturnsMappedAttributesAndReleasesOnce) {
    auto connector = makeConnector();
    connector->initialize();

    AttributeMap result = connector->retrieveAttributes(ResolutionContext("alice"));

    ASSERT_EQ(result.count("mail"), 1u);
    EXPECT_EQ(result["mail"], strings({"alice@example.org"}));
    EXPECT_EQ(provider->acquireCount.load(), 1);
    EXPECT_EQ(provider->releaseCount.load(), 1);
    EXPECT_EQ(builder->lastTimeoutMs->load(), 3000);
}

TEST_F(DataConnectorTest, Retrieve_PassesConfiguredTimeout) {
    ConnectorConfig config;
    config.queryTimeout = std::chrono::milliseconds(250);
    auto connector = makeConnector(config);
    connector->initialize();

    connector->retrieveAttributes(ResolutionContext("alice"));

    EXPECT_EQ(builder->lastTimeoutMs->load(), 250);
}

TEST_F(DataConnectorTest, BuildFailure_DoesNotAcquire) {
    builder->buildError = [] { throw QueryConstructionException("no principal"); };
    auto connector = makeConnector();
    connector->initialize();

    EXPECT_THROW(connector->retrieveAttributes(ResolutionContext()), QueryConstructionException);
    EXPECT_EQ(provider->acquireCount.load(), 0);
}

TEST_F(DataConnectorTest, StrayBuildError_IsWrapped) {
    builder->buildError = [] { throw std::out_of_range("bad index"); };
    auto connector = makeConnector();
    connector->initialize();

    EXPECT_THROW(connector->retrieveAttributes(ResolutionContext("alice")), QueryConstructionException);
}

TEST_F(DataConnectorTest, AcquireFailure_PropagatesWithoutRelease) {
    auto connector = makeConnector();
    connector->initialize();
    provider->failAcquire = true;

    EXPECT_THROW(connector->retrieveAttributes(ResolutionContext("alice")), ConnectionException);
    EXPECT_EQ(provider->releaseCount.load(), 0);
    EXPECT_EQ(builder->executeCount->load(), 0);
}

TEST_F(DataConnectorTest, ExecuteFailure_ReleasesOnce) {
    builder->executeError = [] { throw ExecutionException("backend rejected query"); };
    auto connector = makeConnector();
    connector->initialize();

    EXPECT_THROW(connector->retrieveAttributes(ResolutionContext("alice")), ExecutionException);
    EXPECT_EQ(provider->acquireCount.load(), 1);
    EXPECT_EQ(provider->releaseCount.load(), 1);
    EXPECT_EQ(mapper->mapCount.load(), 0);
}

TEST_F(DataConnectorTest, Timeout_PropagatesAsTimeoutAndReleases) {
    builder->executeError = [] { throw TimeoutException("deadline exceeded"); };
    auto connector = makeConnector();
    connector->initialize();

    EXPECT_THROW(connector->retrieveAttributes(ResolutionContext("alice")), TimeoutException);
    EXPECT_EQ(provider->releaseCount.load(), 1);
}

TEST_F(DataConnectorTest, StrayExecuteError_IsWrappedAsExecution) {
    builder->executeError = [] { throw std::runtime_error("socket closed"); };
    auto connector = makeConnector();
    connector->initialize();

    try {
        connector->retrieveAttributes(ResolutionContext("alice"));
        FAIL() << "expected ExecutionException";
    } catch (const ExecutionException& e) {
        EXPECT_NE(std::string(e.what()).find("socket closed"), std::string::npos);
    }
    EXPECT_EQ(provider->releaseCount.load(), 1);
}

TEST_F(DataConnectorTest, MappingFailure_ReleasesOnce) {
    mapper->mapError = [] { throw std::invalid_argument("unexpected column"); };
    auto connector = makeConnector();
    connector->initialize();

    EXPECT_THROW(connector->retrieveAttributes(ResolutionContext("alice")), MappingException);
    EXPECT_EQ(provider->acquireCount.load(), 1);
    EXPECT_EQ(provider->releaseCount.load(), 1);
}

TEST_F(DataConnectorTest, NoResult_ReturnsEmptyMapByDefault) {
    builder->attributes.clear();
    auto connector = makeConnector();
    connector->initialize();

    AttributeMap result = connector->retrieveAttributes(ResolutionContext("nobody"));

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(provider->releaseCount.load(), 1);
}

TEST_F(DataConnectorTest, NoResult_ThrowsWhenConfigured) {
    builder->attributes.clear();
    ConnectorConfig config;
    config.noResultIsError = true;
    auto connector = makeConnector(config);
    connector->initialize();

    EXPECT_THROW(connector->retrieveAttributes(ResolutionContext("nobody")), NoResultException);
    EXPECT_EQ(provider->releaseCount.load(), 1);
}

TEST_F(DataConnectorTest, ConcurrentRetrieval_BalancesLeases) {
    auto connector = makeConnector();
    connector->initialize();

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&connector, t] {
            for (int i = 0; i < 50; i++) {
                auto result = connector->retrieveAttributes(
                    ResolutionContext("user" + std::to_string(t)));
                EXPECT_EQ(result.size(), 1u);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(provider->acquireCount.load(), 400);
    EXPECT_EQ(provider->releaseCount.load(), 400);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(DataConnectorTest, FailFastValidation_MovesToFailed) {
    validator->healthy = false;
    ConnectorConfig config;
    config.failFastInitialize = true;
    auto connector = makeConnector(config);

    EXPECT_THROW(connector->initialize(), ConfigurationException);
    EXPECT_EQ(connector->getState(), DataConnector::State::Failed);

    EXPECT_THROW(connector->retrieveAttributes(ResolutionContext("alice")), StateException);
    EXPECT_EQ(provider->acquireCount.load(), 0);

    // Failed is terminal; destroy only releases the provider
    connector->destroy();
    EXPECT_EQ(connector->getState(), DataConnector::State::Failed);
    EXPECT_EQ(provider->shutdownCount.load(), 1);
}

TEST_F(DataConnectorTest, FailedValidationWithoutFailFast_StartsDegraded) {
    validator->healthy = false;
    auto connector = makeConnector();

    connector->initialize();

    EXPECT_EQ(connector->getState(), DataConnector::State::Ready);
    EXPECT_FALSE(connector->isValidated());
}

TEST_F(DataConnectorTest, Degraded_RevalidatesBeforeRetrieval) {
    validator->healthy = false;
    auto connector = makeConnector();
    connector->initialize();

    // Still unhealthy: no query is built or executed
    EXPECT_THROW(connector->retrieveAttributes(ResolutionContext("alice")), ConnectionException);
    EXPECT_THROW(connector->retrieveAttributes(ResolutionContext("alice")), ResolutionException);
    EXPECT_EQ(builder->buildCount.load(), 0);
    EXPECT_EQ(provider->acquireCount.load(), 0);

    // Backend recovered
    validator->healthy = true;
    AttributeMap result = connector->retrieveAttributes(ResolutionContext("alice"));

    EXPECT_EQ(result.size(), 1u);
    EXPECT_TRUE(connector->isValidated());

    int validations = validator->validateCount;
    connector->retrieveAttributes(ResolutionContext("alice"));
    EXPECT_EQ(validator->validateCount.load(), validations);
}

TEST_F(DataConnectorTest, Validate_UpdatesValidatedFlag) {
    auto connector = makeConnector();
    EXPECT_THROW(connector->validate(), StateException);

    connector->initialize();
    validator->healthy = false;
    EXPECT_THROW(connector->validate(), ValidationException);
    EXPECT_FALSE(connector->isValidated());

    validator->healthy = true;
    connector->validate();
    EXPECT_TRUE(connector->isValidated());
}

TEST_F(DataConnectorTest, DefaultValidator_LeasesAConnection) {
    DataConnector connector("test");
    connector.setConnectionProvider(provider);
    connector.setQueryBuilder(builder);
    connector.setResultMapper(mapper);

    connector.initialize();

    EXPECT_TRUE(connector.isValidated());
    EXPECT_EQ(provider->acquireCount.load(), 1);
    EXPECT_EQ(provider->releaseCount.load(), 1);
}

TEST_F(DataConnectorTest, DefaultValidator_UnreachableBackendStartsDegraded) {
    provider->failAcquire = true;
    DataConnector connector("test");
    connector.setConnectionProvider(provider);
    connector.setQueryBuilder(builder);
    connector.setResultMapper(mapper);

    connector.initialize();

    EXPECT_EQ(connector.getState(), DataConnector::State::Ready);
    EXPECT_FALSE(connector.isValidated());
}

// ============================================================================
// Result cache
// ============================================================================

TEST_F(DataConnectorTest, Cache_SecondRetrievalSkipsBackend) {
    auto connector = makeConnector();
    connector->setResultCache(std::make_shared<ResultCache>());
    connector->initialize();

    auto first = connector->retrieveAttributes(ResolutionContext("alice"));
    auto second = connector->retrieveAttributes(ResolutionContext("alice"));

    EXPECT_EQ(first, second);
    EXPECT_EQ(builder->executeCount->load(), 1);
    EXPECT_EQ(provider->acquireCount.load(), 1);
    EXPECT_EQ(builder->buildCount.load(), 2);

    connector->retrieveAttributes(ResolutionContext("bob"));
    EXPECT_EQ(builder->executeCount->load(), 2);
}

TEST_F(DataConnectorTest, Cache_EmptyResultStillHonorsNoResultPolicy) {
    builder->attributes.clear();
    ConnectorConfig config;
    config.noResultIsError = true;
    auto connector = makeConnector(config);
    connector->setResultCache(std::make_shared<ResultCache>());
    connector->initialize();

    EXPECT_THROW(connector->retrieveAttributes(ResolutionContext("nobody")), NoResultException);
    EXPECT_THROW(connector->retrieveAttributes(ResolutionContext("nobody")), NoResultException);
    EXPECT_EQ(builder->executeCount->load(), 1);
}

TEST_F(DataConnectorTest, Cache_KeysArePerConnector) {
    auto cache = std::make_shared<ResultCache>();

    auto first = std::make_unique<DataConnector>("first");
    first->setConnectionProvider(provider);
    first->setQueryBuilder(builder);
    first->setResultMapper(mapper);
    first->setValidator(validator);
    first->setResultCache(cache);
    first->initialize();

    auto second = std::make_unique<DataConnector>("second");
    second->setConnectionProvider(provider);
    second->setQueryBuilder(builder);
    second->setResultMapper(mapper);
    second->setValidator(validator);
    second->setResultCache(cache);
    second->initialize();

    first->retrieveAttributes(ResolutionContext("alice"));
    second->retrieveAttributes(ResolutionContext("alice"));

    EXPECT_EQ(builder->executeCount->load(), 2);
    EXPECT_EQ(cache->size(), 2u);
}
