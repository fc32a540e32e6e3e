#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "dotenv/core/convert.hpp"
#include "dotenv/core/error.hpp"
#include "dotenv/core/types.hpp"
#include "dotenv/core/utils.hpp"
#include "dotenv/env/environment.hpp"
#include "dotenv/export.hpp"
#include "dotenv/io/writer.hpp"

namespace dotenv::bind {

struct FieldOptions {
    bool required = false;
    std::optional<std::string> default_value;
};

struct FieldSpec {
    std::string key;
    FieldOptions options;
};

/// Parse a field tag of the form "KEY[,required][,default=value]".
///
/// Options are comma separated, so a default given through a tag cannot
/// itself contain a comma; use the FieldOptions overload of
/// Binder::field() for such defaults. An empty "default=" means no default.
DOTENV_API auto parse_field_tag(std::string_view tag) -> Result<FieldSpec>;

// ---------------------------------------------------------------------------
// FieldCodec<T>: string <-> member conversion, picked by member type.
// Member types without a specialization are rejected at compile time.
// ---------------------------------------------------------------------------

template <typename T, typename Enable = void>
struct FieldCodec;

template <>
struct FieldCodec<std::string> {
    static constexpr std::string_view kind = "string";
    static auto decode(std::string_view s) -> Result<std::string> { return std::string(s); }
    static auto encode(const std::string& v) -> std::string { return v; }
};

template <>
struct FieldCodec<bool> {
    static constexpr std::string_view kind = "bool";
    static auto decode(std::string_view s) -> Result<bool> { return convert::to_bool(s); }
    static auto encode(bool v) -> std::string { return convert::format_bool(v); }
};

template <typename T>
struct FieldCodec<T, std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T>>> {
    static constexpr std::string_view kind = "int";
    static auto decode(std::string_view s) -> Result<T> { return convert::to_int<T>(s); }
    static auto encode(T v) -> std::string { return std::to_string(v); }
};

template <typename T>
struct FieldCodec<T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> &&
                                      !std::is_same_v<T, bool>>> {
    static constexpr std::string_view kind = "uint";
    static auto decode(std::string_view s) -> Result<T> { return convert::to_uint<T>(s); }
    static auto encode(T v) -> std::string { return std::to_string(v); }
};

template <typename T>
struct FieldCodec<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static constexpr std::string_view kind = "float";
    static auto decode(std::string_view s) -> Result<T> { return convert::to_float<T>(s); }
    static auto encode(T v) -> std::string {
        return convert::format_float(static_cast<double>(v));
    }
};

template <>
struct FieldCodec<std::chrono::nanoseconds> {
    static constexpr std::string_view kind = "duration";
    static auto decode(std::string_view s) -> Result<std::chrono::nanoseconds> {
        return convert::to_duration(s);
    }
    static auto encode(std::chrono::nanoseconds v) -> std::string {
        return convert::format_duration(v);
    }
};

template <>
struct FieldCodec<std::vector<std::string>> {
    static constexpr std::string_view kind = "list";
    static auto decode(std::string_view s) -> Result<std::vector<std::string>> {
        return convert::to_list(s);
    }
    static auto encode(const std::vector<std::string>& v) -> std::string {
        return utils::join(v, ",");
    }
};

/// Declarative mapping between a record's members and variable names.
///
/// Built once per record type:
///
///     const auto binder = Binder<ServerConfig>()
///         .field("HOST,default=localhost", &ServerConfig::host)
///         .field("PORT,required", &ServerConfig::port)
///         .field("TIMEOUT", &ServerConfig::timeout, {.default_value = "30s"});
///
/// and then used to fill records from an environment (unmarshal) or to
/// turn records back into variables (marshal).
template <typename Record>
class Binder {
public:
    struct Field {
        FieldSpec spec;
        std::string_view kind;
        std::function<VoidResult(Record&, std::string_view)> decode;
        std::function<std::string(const Record&)> encode;
    };

    /// Bind `member` using a field tag. A malformed tag is reported by the
    /// next unmarshal() or marshal() call.
    template <typename Member>
    auto field(std::string_view tag, Member Record::*member) -> Binder& {
        auto spec = parse_field_tag(tag);
        if (!spec) {
            if (!tag_error_) tag_error_ = spec.error();
            return *this;
        }
        add(std::move(*spec), member);
        return *this;
    }

    template <typename Member>
    auto field(std::string key, Member Record::*member, FieldOptions options) -> Binder& {
        add(FieldSpec{std::move(key), std::move(options)}, member);
        return *this;
    }

    /// Fill `out` from `source`, looking up prefix + key for every field.
    ///
    /// Missing variables fall back to the field default; without one a
    /// required field fails with RequiredMissing and an optional field
    /// keeps its current value. Conversion failures report ConversionFailed
    /// naming the variable.
    auto unmarshal(Record& out, const env::EnvironmentAccessor& source,
                   std::string_view prefix = "") const -> VoidResult {
        if (tag_error_) return std::unexpected(*tag_error_);

        for (const auto& f : fields_) {
            auto key = std::string(prefix) + f.spec.key;

            auto raw = source.get(key);
            if (!raw) {
                if (f.spec.options.required) {
                    return std::unexpected(make_error(
                        ErrorCode::RequiredMissing,
                        "required environment variable " + key + " is not set"));
                }
                if (!f.spec.options.default_value) {
                    continue;
                }
                raw = f.spec.options.default_value;
            }

            if (auto result = f.decode(out, *raw); !result) {
                return std::unexpected(make_error(
                    ErrorCode::ConversionFailed,
                    "failed to parse " + std::string(f.kind) + " for " + key,
                    std::string(result.error().detail())));
            }
        }
        return {};
    }

    auto unmarshal(Record& out, const EnvMap& source, std::string_view prefix = "") const
        -> VoidResult {
        env::MapEnvironment view(source);
        return unmarshal(out, view, prefix);
    }

    /// Render every bound member as prefix + key -> text. Members that
    /// encode to an empty string are left out.
    auto marshal(const Record& in, std::string_view prefix = "") const -> Result<EnvMap> {
        if (tag_error_) return std::unexpected(*tag_error_);

        EnvMap vars;
        for (const auto& f : fields_) {
            auto value = f.encode(in);
            if (value.empty()) continue;
            vars.insert_or_assign(std::string(prefix) + f.spec.key, std::move(value));
        }
        return vars;
    }

    auto marshal_to_file(const std::filesystem::path& path, const Record& in,
                         std::string_view prefix = "") const -> VoidResult {
        auto vars = marshal(in, prefix);
        if (!vars) return std::unexpected(vars.error());
        return io::write_file(path, *vars);
    }

    [[nodiscard]] auto fields() const noexcept -> const std::vector<Field>& { return fields_; }

private:
    template <typename Member>
    void add(FieldSpec spec, Member Record::*member) {
        using Codec = FieldCodec<Member>;

        Field f;
        f.spec = std::move(spec);
        f.kind = Codec::kind;
        f.decode = [member](Record& r, std::string_view raw) -> VoidResult {
            auto value = Codec::decode(raw);
            if (!value) return std::unexpected(value.error());
            r.*member = std::move(*value);
            return {};
        };
        f.encode = [member](const Record& r) -> std::string {
            return Codec::encode(r.*member);
        };
        fields_.push_back(std::move(f));
    }

    std::vector<Field> fields_;
    std::optional<Error> tag_error_;
};

} // namespace dotenv::bind
