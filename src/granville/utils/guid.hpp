
#pragma once

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_hash.hpp>

#include <string>
#include <string_view>

/**
 * @defgroup guid Guids
 * @ingroup granville-utils
 *
 * Request, message and stream ids are random (version 4) uuids.
 */

namespace granville
{
using Guid = boost::uuids::uuid;

/// Hash functor for unordered containers keyed by `Guid`
using GuidHash = boost::hash<Guid>;

/// @ingroup guid
/// @brief A fresh random guid. Thread safe.
Guid new_guid();

/// @ingroup guid
/// @brief The all zeros guid.
Guid nil_guid();

/// @ingroup guid
/// @brief Canonical form: `xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx`
std::string to_string(const Guid& guid);

/// @ingroup guid
/// @brief 32 lower-case hex digits, no dashes.
std::string to_compact_string(const Guid& guid);

} // namespace granville
