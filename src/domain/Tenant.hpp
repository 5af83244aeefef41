/**
 * @file Tenant.hpp
 * @brief Tenant identifier shared by every tenant-scoped operation.
 */

#pragma once
#include <string>

namespace fieldtrack::domain {

/**
 * @brief Opaque key of a tenant (company). Numeric ids are carried in their decimal form.
 *
 * Resolved upstream from the authenticated caller and passed into every call;
 * never cached across calls.
 */
using TenantId = std::string;

} // namespace fieldtrack::domain
