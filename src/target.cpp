#include "keel/target.hpp"

#include "keel/utility.hpp"

#include <string>
#include <string_view>

namespace keel {

Result<BuildTarget> BuildTarget::parse(std::string_view text) {
    if (!text.starts_with("//")) {
        return fail(ErrorKind::Parse, std::string(text) + " must start with //");
    }

    std::string_view rest = text.substr(2);
    size_t colon = rest.find(':');
    if (colon == std::string_view::npos) {
        return fail(ErrorKind::Parse, std::string(text) + " must contain a ':' before the short name");
    }
    if (rest.find(':', colon + 1) != std::string_view::npos) {
        return fail(ErrorKind::Parse, std::string(text) + " contains more than one ':'");
    }

    std::string_view base = rest.substr(0, colon);
    std::string_view name = rest.substr(colon + 1);
    std::string_view flavor;

    if (size_t hash = name.find('#'); hash != std::string_view::npos) {
        flavor = name.substr(hash + 1);
        name = name.substr(0, hash);
        if (flavor.empty()) {
            return fail(ErrorKind::Parse, std::string(text) + " has an empty flavor");
        }
    }

    if (name.empty()) {
        return fail(ErrorKind::Parse, std::string(text) + " has an empty short name");
    }
    if (name.find('/') != std::string_view::npos) {
        return fail(ErrorKind::Parse, std::string(text) + " has a '/' in its short name");
    }

    // Base path segments must be non-empty: no leading, trailing or doubled slash.
    if (!base.empty()) {
        if (base.front() == '/' || base.back() == '/' || base.find("//") != std::string_view::npos) {
            return fail(ErrorKind::Parse, std::string(text) + " has an empty base path segment");
        }
    }

    return BuildTarget(std::string(base), std::string(name), std::string(flavor));
}

std::string BuildTarget::full_name() const {
    std::string out;
    out.reserve(3 + base_path_.size() + short_name_.size() + (flavor_.empty() ? 0 : flavor_.size() + 1));
    out += "//";
    out += base_path_;
    out += ':';
    out += short_name_;
    if (!flavor_.empty()) {
        out += '#';
        out += flavor_;
    }
    return out;
}

} // namespace keel
