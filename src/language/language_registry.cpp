#include <nexusexec/language/language_registry.hpp>

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/language/language_descriptor.hpp>
#include <nexusexec/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <cctype>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace nexusexec {

namespace {

bool iequals(std::string_view lhs, std::string_view rhs) {
    return ranges::equal(lhs, rhs, [](char lhs_chr, char rhs_chr) {
        return std::tolower(static_cast<unsigned char>(lhs_chr)) == std::tolower(static_cast<unsigned char>(rhs_chr));
    });
}

bool matches(const LanguageDescriptor& descriptor, std::string_view language_id) {
    return iequals(descriptor.id, language_id) ||
           ranges::any_of(descriptor.aliases, [language_id](const std::string& alias) { return iequals(alias, language_id); });
}

} // namespace

LanguageRegistry::LanguageRegistry()
    : LanguageRegistry(std::vector<LanguageDescriptor>{}) {}

LanguageRegistry::LanguageRegistry(const std::vector<LanguageDescriptor>& extra) {
    for (const auto& descriptor : builtin_languages()) {
        add(descriptor);
    }

    for (const auto& descriptor : extra) {
        add(descriptor);
    }

    LOG_DEBUG("Language registry: {}", ids());
}

void LanguageRegistry::add(const LanguageDescriptor& descriptor) {
    auto existing = ranges::find_if(descriptors_, [&descriptor](const LanguageDescriptor& other) {
        return iequals(other.id, descriptor.id);
    });

    if (existing != descriptors_.end()) {
        LOG_INFO("Overriding built-in language {:?}", descriptor.id);
        *existing = descriptor;
        return;
    }

    descriptors_.push_back(descriptor);
}

Result<std::reference_wrapper<const LanguageDescriptor>> LanguageRegistry::resolve(std::string_view language_id) const {
    auto iter = ranges::find_if(descriptors_,
                                [language_id](const LanguageDescriptor& descriptor) { return matches(descriptor, language_id); });

    if (iter == descriptors_.end()) {
        return Error{ErrorKind::UnsupportedLanguage, fmt::format("Unsupported language: {}", language_id)};
    }

    return std::cref(*iter);
}

bool LanguageRegistry::contains(std::string_view language_id) const {
    return resolve(language_id).has_value();
}

std::vector<std::string> LanguageRegistry::ids() const {
    return descriptors_ | ranges::views::transform(&LanguageDescriptor::id) | ranges::to<std::vector<std::string>>();
}

} // namespace nexusexec
