#pragma once

#include <expected>
#include <istream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

enum class CredentialStatus { Ok, Missing, Placeholder, InvalidFormat };

struct Credential {
    static constexpr std::string_view KEY_NAME = "GROQ_API_KEY";
    static constexpr std::string_view PLACEHOLDER = "your_api_key_here";
    static constexpr std::string_view KEY_PREFIX = "gsk_";
    static constexpr size_t KEY_BODY_LENGTH = 52;

    std::string api_key;
    std::string source; // file the key was read from

    // Missing and Placeholder are fatal; InvalidFormat is only a warning
    // since the provider may change its key format.
    CredentialStatus check() const;

    // "gsk_" followed by exactly 52 ASCII letters or digits.
    static bool format_valid(std::string_view key);

    // Reads the first existing candidate. A file readable by group or others
    // is tightened to 0600 with a warning.
    static std::expected<Credential, std::string> load(const std::vector<std::string>& candidates);
    static std::expected<Credential, std::string> load_file(const std::string& path);
};

// KEY=VALUE lines; blank lines, '#' comments, an `export ` prefix and
// surrounding quotes are tolerated. Whitespace inside values is dropped.
std::map<std::string, std::string> parse_env(std::istream& in);
