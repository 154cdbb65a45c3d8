#include "credential.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::map<std::string, std::string> parse_env(std::istream& in) {
    std::map<std::string, std::string> vars;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.starts_with("export ")) line = trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = line.substr(eq + 1);
        std::erase_if(value, [](char c) {
            return c == '"' || c == '\'' || std::isspace(static_cast<unsigned char>(c));
        });
        vars[key] = value;
    }
    return vars;
}

bool Credential::format_valid(std::string_view key) {
    if (!key.starts_with(KEY_PREFIX)) return false;
    auto body = key.substr(KEY_PREFIX.size());
    if (body.size() != KEY_BODY_LENGTH) return false;
    return std::all_of(body.begin(), body.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    });
}

CredentialStatus Credential::check() const {
    if (api_key.empty()) return CredentialStatus::Missing;
    if (api_key == PLACEHOLDER) return CredentialStatus::Placeholder;
    if (!format_valid(api_key)) return CredentialStatus::InvalidFormat;
    return CredentialStatus::Ok;
}

std::expected<Credential, std::string> Credential::load_file(const std::string& path) {
    std::error_code ec;
    auto perms = fs::status(path, ec).permissions();
    if (ec) {
        return std::unexpected("cannot stat " + path + ": " + ec.message());
    }

    constexpr auto loose = fs::perms::group_all | fs::perms::others_all;
    if ((perms & loose) != fs::perms::none) {
        std::println(stderr, "credential: {} is accessible by other users, restricting to 0600", path);
        fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        if (ec) {
            std::println(stderr, "credential: chmod {} failed: {}", path, ec.message());
        }
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected("could not open " + path);
    }

    auto vars = parse_env(f);
    Credential cred;
    cred.source = path;
    if (auto it = vars.find(std::string(KEY_NAME)); it != vars.end()) {
        cred.api_key = it->second;
    }
    return cred;
}

std::expected<Credential, std::string> Credential::load(const std::vector<std::string>& candidates) {
    for (const auto& path : candidates) {
        std::error_code ec;
        if (fs::is_regular_file(path, ec)) {
            return load_file(path);
        }
    }

    std::string msg = ".env file not found. Checked locations:";
    for (const auto& path : candidates) msg += "\n  - " + path;
    return std::unexpected(msg);
}
