#pragma once

#include <lockbox/schema/asset_info.hpp>
#include <optional>
#include <string>

namespace lockbox::execution {

/// Reason a collection may not enter (or leave) custody, or std::nullopt when
/// it is lockable. Unknown collections, fungible collections and collections
/// carrying any custom fee are rejected.
std::optional<std::string> check_lockable(
    const std::optional<lockbox::schema::asset_info_t>& info);

}  // namespace lockbox::execution
