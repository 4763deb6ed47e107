#include "cabinet/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace cabinet::cli {
    namespace {
        [[nodiscard]] cabinet::core::Status usage_error() noexcept {
            return cabinet::core::make_status(cabinet::core::StatusDomain::Cli, cabinet::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count,
                                                  const char* name, std::size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool store_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            opt->id = spec.id;
            opt->type = spec.type;
            switch (spec.type) {
                case OptionType::Flag:
                    opt->value.boolv = 1;
                    return value == nullptr;
                case OptionType::String:
                    opt->value.str = value;
                    return value != nullptr;
                case OptionType::I64:
                    return parse_i64(value, &opt->value.i64v);
            }
            return false;
        }

        [[nodiscard]] cabinet::core::Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return usage_error();
            }
            out->data[out->len++] = opt;
            return cabinet::core::ok_status();
        }
    } // namespace

    cabinet::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return usage_error();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return usage_error();
        }
        if (spec_count > 0 && specs == nullptr) {
            return usage_error();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;
            if (tok[1] == '-') {
                // --name, --name=value
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const std::size_t name_len = eq ? static_cast<std::size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return usage_error();
                }
                spec = find_long(specs, spec_count, name, name_len);
                inline_value = eq ? eq + 1 : nullptr;
            } else {
                // -x, -xvalue
                spec = find_short(specs, spec_count, tok[1]);
                inline_value = tok[2] != '\0' ? tok + 2 : nullptr;
            }
            if (spec == nullptr) {
                return usage_error();
            }

            const char* value = inline_value;
            ++i;
            if (spec->type != OptionType::Flag && value == nullptr) {
                if (i >= args.argc || args.argv[i] == nullptr) {
                    return usage_error();
                }
                value = args.argv[i++];
            }

            ParsedOption opt{};
            if (!store_value(*spec, value, &opt)) {
                return usage_error();
            }
            const cabinet::core::Status s = push_option(out, opt);
            if (!cabinet::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return cabinet::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }

    const OptionSpec* option_table(u32* count) noexcept {
        static constexpr OptionSpec kOptions[] = {
            {OptionId::User, OptionType::I64, "user", 'u'},
            {OptionId::Parent, OptionType::I64, "parent", 'p'},
            {OptionId::Folder, OptionType::I64, "folder", 'f'},
            {OptionId::Name, OptionType::String, "name", 'n'},
            {OptionId::Ttl, OptionType::I64, "ttl", 't'},
            {OptionId::Perm, OptionType::String, "perm", '\0'},
            {OptionId::Body, OptionType::String, "body", 'b'},
            {OptionId::Db, OptionType::String, "db", '\0'},
            {OptionId::Data, OptionType::String, "data", '\0'},
        };
        if (count != nullptr) {
            *count = static_cast<u32>(sizeof(kOptions) / sizeof(kOptions[0]));
        }
        return kOptions;
    }
} // namespace cabinet::cli
