#include "keel/manifest.hpp"

#include "mmap.hpp"

#include <charconv>
#include <string>
#include <string_view>
#include <vector>

namespace keel {

namespace {

std::vector<std::string_view> split(std::string_view list, char sep) {
    std::vector<std::string_view> parts;
    std::string_view remaining = list;
    while (!remaining.empty()) {
        size_t pos = remaining.find(sep);
        std::string_view part;
        if (pos == std::string_view::npos) {
            part = remaining;
            remaining = {};
        } else {
            part = remaining.substr(0, pos);
            remaining = remaining.substr(pos + 1);
        }
        if (!part.empty())
            parts.push_back(part);
    }
    return parts;
}

Result<void> parse_pair(const std::string_view line, Definitions &into, size_t line_no) {
    size_t first_pipe = line.find('|');
    size_t second_pipe = line.find('|', first_pipe + 1);
    if (second_pipe == std::string_view::npos) {
        return fail(ErrorKind::Parse,
                    "line " + std::to_string(line_no) + ": malformed line (missing second pipe): " + std::string(line));
    }

    into.emplace_back(line.substr(first_pipe + 1, second_pipe - (first_pipe + 1)), // key
                                      line.substr(second_pipe + 1)                                 // value
    );
    return {};
}

Result<void> parse_rule(const std::string_view line, Manifest &manifest, size_t line_no) {
    const std::string where = "line " + std::to_string(line_no) + ": ";

    // type|target|deps|inputs, then the fields
    std::string_view columns[4];
    std::string_view rest = line;
    for (size_t i = 0; i < 4; ++i) {
        size_t pipe = rest.find('|');
        if (pipe == std::string_view::npos) {
            if (i < 3) {
                return fail(ErrorKind::Parse, where + "malformed rule line (expected type|target|deps|inputs): " +
                                                  std::string(line));
            }
            columns[i] = rest;
            rest = {};
            break;
        }
        columns[i] = rest.substr(0, pipe);
        rest = rest.substr(pipe + 1);
    }

    RuleSpec spec;
    spec.type = std::string(columns[0]);
    if (spec.type.empty()) {
        return fail(ErrorKind::Parse, where + "missing rule type: " + std::string(line));
    }

    auto target = BuildTarget::parse(columns[1]);
    if (!target)
        return fail(ErrorKind::Parse, where + target.error().message);
    spec.target = std::move(*target);

    for (auto dep : split(columns[2], ',')) {
        auto dep_target = BuildTarget::parse(dep);
        if (!dep_target)
            return fail(ErrorKind::Parse, where + dep_target.error().message);
        spec.deps.push_back(std::move(*dep_target));
    }

    for (auto input : split(columns[3], ',')) {
        spec.inputs.emplace_back(input);
    }

    while (!rest.empty()) {
        size_t eq = rest.find('=');
        size_t pipe = rest.find('|');
        if (eq == std::string_view::npos || (pipe != std::string_view::npos && pipe < eq)) {
            return fail(ErrorKind::Parse, where + "malformed field (expected name=value): " + std::string(rest));
        }

        std::string_view name = rest.substr(0, eq);
        std::string_view value;
        if (name == "cmd" || pipe == std::string_view::npos) {
            value = rest.substr(eq + 1);
            rest = {};
        } else {
            value = rest.substr(eq + 1, pipe - (eq + 1));
            rest = rest.substr(pipe + 1);
        }
        if (name.empty()) {
            return fail(ErrorKind::Parse, where + "empty field name in: " + std::string(line));
        }
        spec.fields.emplace_back(name, value);
    }

    manifest.rules.push_back(std::move(spec));
    return {};
}

Result<bool> parse_bool(std::string_view key, std::string_view value) {
    if (value == "true" || value == "1" || value == "yes")
        return true;
    if (value == "false" || value == "0" || value == "no")
        return false;
    return fail(ErrorKind::Parse, "DEF " + std::string(key) + " expects true or false, got: " + std::string(value));
}

} // namespace

Result<Manifest> parse_manifest(std::string_view content) {
    Manifest manifest;

    size_t start = 0;
    size_t line_no = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        if (end == std::string_view::npos) {
            end = content.size();
        }
        ++line_no;

        std::string_view line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (!line.empty()) {
            char first = line[0];

            if (first == '#') {
                // Comment
            } else if (line.starts_with("DEF|")) {
                if (auto res = parse_pair(line, manifest.definitions, line_no); !res)
                    return std::unexpected(res.error());
            } else if (line.starts_with("ALIAS|")) {
                if (auto res = parse_pair(line, manifest.aliases, line_no); !res)
                    return std::unexpected(res.error());
            } else {
                if (auto res = parse_rule(line, manifest, line_no); !res)
                    return std::unexpected(res.error());
            }
        }

        start = end + 1;
    }
    return manifest;
}

Result<Manifest> parse_manifest_file(const std::filesystem::path &path) {
    auto file = MappedFile::open(path);
    if (!file)
        return std::unexpected(file.error());

    auto manifest = parse_manifest((*file)->content());
    if (!manifest)
        return fail(ErrorKind::Parse, path.string() + ": " + manifest.error().message);
    return manifest;
}

Result<void> apply_definitions(const Definitions &definitions, EngineConfig &config) {
    for (const auto &[key, value] : definitions) {
        if (key == "jobs") {
            size_t jobs = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), jobs);
            if (ec != std::errc{} || ptr != value.data() + value.size()) {
                return fail(ErrorKind::Parse, "DEF jobs expects a number, got: " + value);
            }
            config.jobs = jobs;
        } else if (key == "keep_going") {
            auto flag = parse_bool(key, value);
            if (!flag)
                return std::unexpected(flag.error());
            config.keep_going = *flag;
        } else if (key == "verbose") {
            auto flag = parse_bool(key, value);
            if (!flag)
                return std::unexpected(flag.error());
            config.verbose = *flag;
        } else if (key == "cache_dir") {
            config.cache_dir = value;
        } else if (key == "out_dir") {
            config.out_dir = value;
        } else {
            return fail(ErrorKind::Parse, "Unknown definition: " + key);
        }
    }
    return {};
}

Result<void> add_rules(const Manifest &manifest, const RuleKindRegistry &registry, BuildRuleResolver &resolver) {
    for (const auto &spec : manifest.rules) {
        auto builder = registry.create(spec);
        if (!builder)
            return std::unexpected(builder.error());
        if (auto res = resolver.add(std::move(*builder)); !res)
            return res;
    }
    return {};
}

} // namespace keel
