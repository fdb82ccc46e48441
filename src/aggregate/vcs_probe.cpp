#include <scry/aggregate/vcs_probe.h>

#include <system_error>

namespace scry::aggregate {

Result<nlohmann::json> GitPresenceProbe::probe(const std::filesystem::path& root) {
    std::error_code ec;
    bool present = std::filesystem::exists(root / ".git", ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied, ec.message()};
    }
    return nlohmann::json{{"is_git_repo", present}};
}

} // namespace scry::aggregate
