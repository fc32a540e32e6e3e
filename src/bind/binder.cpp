#include "dotenv/bind/binder.hpp"

namespace dotenv::bind {

auto parse_field_tag(std::string_view tag) -> Result<FieldSpec> {
    auto parts = utils::split(tag, ',');

    FieldSpec spec;
    spec.key = utils::trim(parts.front());
    if (spec.key.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                          "field tag has no key", std::string(tag)));
    }

    constexpr std::string_view kDefaultPrefix = "default=";
    for (size_t i = 1; i < parts.size(); ++i) {
        auto option = utils::trim(parts[i]);
        if (option == "required") {
            spec.options.required = true;
        } else if (utils::starts_with(option, kDefaultPrefix)) {
            auto value = option.substr(kDefaultPrefix.size());
            if (!value.empty()) {
                spec.options.default_value = std::move(value);
            }
        } else if (!option.empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "unknown field tag option '" + option + "'",
                                              std::string(tag)));
        }
    }
    return spec;
}

} // namespace dotenv::bind
