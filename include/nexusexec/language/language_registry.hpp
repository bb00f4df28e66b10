#pragma once

#include <nexusexec/common/error_types.hpp>
#include <nexusexec/language/language_descriptor.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace nexusexec {

/// Immutable table of supported languages.
///
/// Built once at startup from the built-in descriptors plus any from the configuration file;
/// a configured descriptor with the id of a built-in one replaces it. Lookups are
/// case-insensitive and honour aliases. Safe to share between threads.
class LanguageRegistry
{
public:
    /// Only the built-in languages
    LanguageRegistry();

    /// Built-in languages, then ``extra`` (overriding by id)
    explicit LanguageRegistry(const std::vector<LanguageDescriptor>& extra);

    Result<std::reference_wrapper<const LanguageDescriptor>> resolve(std::string_view language_id) const;

    bool contains(std::string_view language_id) const;

    /// Canonical ids, in registration order
    std::vector<std::string> ids() const;

    std::size_t size() const { return descriptors_.size(); }

private:
    void add(const LanguageDescriptor& descriptor);

    std::vector<LanguageDescriptor> descriptors_;
};

} // namespace nexusexec
