/**
 * @file strategies.h
 * @brief Pluggable strategies composed by a DataConnector
 *
 * Query builders and result mappers are shared by concurrent retrieval
 * calls; they must be stateless or synchronize internally.
 */

#pragma once

#include <idp/dc/attribute.h>
#include <idp/dc/executable_query.h>
#include <idp/dc/resolution_context.h>

#include <memory>

namespace idp::dc {

/**
 * @brief Turns a resolution context into an executable query
 */
class IQueryBuilder {
public:
    virtual ~IQueryBuilder() = default;

    /**
     * @brief Build the query for a context. Pure, no I/O.
     * @throws QueryConstructionException if the context lacks required data
     */
    virtual std::unique_ptr<IExecutableQuery> build(const ResolutionContext& context) const = 0;
};

/**
 * @brief Converts a raw backend result into attributes
 */
class IResultMapper {
public:
    virtual ~IResultMapper() = default;

    /**
     * @brief Map every row/entry of the result
     * @return Empty map for a zero-match result
     * @throws MappingException if the result shape cannot be interpreted
     */
    virtual AttributeMap map(const IRawResult& raw) const = 0;
};

/**
 * @brief Health check run at start-up and on demand
 */
class IValidator {
public:
    virtual ~IValidator() = default;

    /**
     * @throws ValidationException if the backend is unusable
     */
    virtual void validate() const = 0;
};

/**
 * @brief Default validator: a connection can be leased and returned
 */
class ConnectionProviderValidator : public IValidator {
public:
    explicit ConnectionProviderValidator(std::shared_ptr<IConnectionProvider> provider);

    void validate() const override;

private:
    std::shared_ptr<IConnectionProvider> provider_;
};

} // namespace idp::dc
