/**
 * @file connection.cpp
 */

#include <idp/dc/connection.h>

#include <spdlog/spdlog.h>

namespace idp::dc {

void IConnectionProvider::releaseGeneric(IConnection& conn) noexcept {
    try {
        conn.release();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to release {} connection: {}", getBackendType(), e.what());
    }
}

} // namespace idp::dc
