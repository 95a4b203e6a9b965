#pragma once

#include <tsbase/diag/DiagCode.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tsbase::unit {

// Compiler options a test case may list several values for. Declaration order
// is the variant naming order.
enum class VariationProp : uint8_t {
    kAllowArbitraryExtensions,
    kAllowImportingTsExtensions,
    kAllowJs,
    kEsModuleInterop,
    kExactOptionalPropertyTypes,
    kIsolatedModules,
    kJsx,
    kModule,
    kModuleDetection,
    kModuleResolution,
    kNoEmit,
    kNoImplicitAny,
    kNoImplicitOverride,
    kNoPropertyAccessFromIndexSignature,
    kNoUncheckedIndexedAccess,
    kNoUncheckedSideEffectImports,
    kPreserveConstEnums,
    kResolveJsonModule,
    kResolvePackageJsonExports,
    kStrict,
    kStrictBuiltinIteratorReturn,
    kStrictNullChecks,
    kTarget,
    kUseDefineForClassFields,
    kUseUnknownInCatchVariables,
    kVerbatimModuleSyntax,
};

inline constexpr std::size_t k_variation_prop_count = 26;

// lowercase directive spelling, also used in variant names
const char* prop_name(VariationProp p);
std::optional<VariationProp> prop_from_name(std::string_view lowered);

/// @brief Values `*` expands to for p. Returns false when p has no wildcard set.
bool expand_wildcard(VariationProp p, std::vector<std::string>& out);

struct TestSettings {
    bool no_types_and_symbols = false;
    std::optional<std::string> base_url{};
    bool no_implicit_references = false;
    std::optional<std::string> include_built_file{};
    std::optional<std::vector<std::string>> lib_files{};

    bool operator==(const TestSettings&) const = default;
};

struct TestVariant {
    std::string name{};
    std::array<std::optional<std::string_view>, k_variation_prop_count> values{};

    std::optional<std::string_view> get(VariationProp p) const {
        return values[static_cast<std::size_t>(p)];
    }
    void set(VariationProp p, std::optional<std::string_view> v) {
        values[static_cast<std::size_t>(p)] = v;
    }

    bool operator==(const TestVariant&) const = default;
};

class VariationIter;

class TestVariations {
public:
    const std::vector<std::string>& get(VariationProp p) const {
        return values_[static_cast<std::size_t>(p)];
    }
    void push(VariationProp p, std::string value) {
        values_[static_cast<std::size_t>(p)].push_back(std::move(value));
    }
    void clear(VariationProp p) {
        values_[static_cast<std::size_t>(p)].clear();
    }

    VariationIter iter() const;

    // every variant, in iteration order
    std::vector<TestVariant> variants() const;

    bool operator==(const TestVariations&) const = default;

private:
    std::array<std::vector<std::string>, k_variation_prop_count> values_{};
};

/// @brief Cartesian product over the axes holding two or more values.
///
/// Single-valued axes are fixed in every variant and stay out of the name.
/// The last multi-valued axis cycles fastest. With no multi-valued axis exactly
/// one variant with an empty name is produced. Variants borrow the values of
/// the TestVariations they were created from.
class VariationIter {
public:
    explicit VariationIter(const TestVariations& variations);

    bool next(TestVariant& out);

private:
    void update_name_();

    const TestVariations* variations_ = nullptr;
    std::vector<VariationProp> name_props_{};
    std::vector<std::size_t> cursor_{};
    TestVariant current_{};
    bool started_ = false;
    bool done_ = false;
};

/// @brief One multi-file test case document.
///
/// Names and contents are views into the document buffer (and into path for
/// the implicit file name); both must outlive the unit.
struct TestUnit {
    std::string_view path{};
    TestSettings settings{};
    TestVariations variations{};
    std::vector<std::string_view> file_names{};
    std::vector<std::string_view> file_contents{};
    std::unordered_map<std::string_view, std::string_view> symlinks{};

    std::optional<std::string_view> find_file(std::string_view name) const;
};

std::optional<TestUnit> parse_test_unit(std::string_view path, std::string_view data, diag::Bag& bag);

/// @brief Indices of the files a checker compiles as program roots.
std::vector<std::size_t> select_root_files(const TestUnit& unit);

} // namespace tsbase::unit
