#include <tsbase/unit/TestUnit.hpp>

namespace tsbase::unit {

namespace {

constexpr std::array<const char*, k_variation_prop_count> k_prop_names = {
    "allowarbitraryextensions",
    "allowimportingtsextensions",
    "allowjs",
    "esmoduleinterop",
    "exactoptionalpropertytypes",
    "isolatedmodules",
    "jsx",
    "module",
    "moduledetection",
    "moduleresolution",
    "noemit",
    "noimplicitany",
    "noimplicitoverride",
    "nopropertyaccessfromindexsignature",
    "nouncheckedindexedaccess",
    "nouncheckedsideeffectimports",
    "preserveconstenums",
    "resolvejsonmodule",
    "resolvepackagejsonexports",
    "strict",
    "strictbuiltiniteratorreturn",
    "strictnullchecks",
    "target",
    "usedefineforclassfields",
    "useunknownincatchvariables",
    "verbatimmodulesyntax",
};

} // namespace

const char* prop_name(VariationProp p) {
    const auto i = static_cast<std::size_t>(p);
    if (i >= k_prop_names.size()) return "unknown";
    return k_prop_names[i];
}

std::optional<VariationProp> prop_from_name(std::string_view lowered) {
    for (std::size_t i = 0; i < k_prop_names.size(); ++i) {
        if (lowered == k_prop_names[i]) return static_cast<VariationProp>(i);
    }
    return std::nullopt;
}

bool expand_wildcard(VariationProp p, std::vector<std::string>& out) {
    switch (p) {
        case VariationProp::kModule:
            out = {
                "amd", "es6", "umd", "none", "es2020", "es2022", "esnext",
                "node16", "node18", "system", "commonjs", "nodenext", "preserve",
            };
            return true;
        case VariationProp::kStrictBuiltinIteratorReturn:
        case VariationProp::kUseDefineForClassFields:
        case VariationProp::kStrict:
            out = {"true", "false"};
            return true;
        default:
            return false;
    }
}

VariationIter TestVariations::iter() const {
    return VariationIter(*this);
}

std::vector<TestVariant> TestVariations::variants() const {
    std::vector<TestVariant> out{};
    VariationIter it = iter();
    TestVariant v{};
    while (it.next(v)) out.push_back(v);
    return out;
}

VariationIter::VariationIter(const TestVariations& variations)
    : variations_(&variations) {
    for (std::size_t i = 0; i < k_variation_prop_count; ++i) {
        const auto prop = static_cast<VariationProp>(i);
        const auto& values = variations.get(prop);
        if (values.empty()) continue;

        current_.set(prop, std::string_view(values.front()));
        if (values.size() >= 2) {
            name_props_.push_back(prop);
            cursor_.push_back(0);
        }
    }
    update_name_();
}

void VariationIter::update_name_() {
    if (name_props_.empty()) {
        current_.name.clear();
        return;
    }

    std::string name = "(";
    for (std::size_t i = 0; i < name_props_.size(); ++i) {
        if (i != 0) name += ",";
        name += prop_name(name_props_[i]);
        name += "=";
        name += *current_.get(name_props_[i]);
    }
    name += ")";
    current_.name = std::move(name);
}

bool VariationIter::next(TestVariant& out) {
    if (done_) return false;

    if (!started_) {
        started_ = true;
        if (name_props_.empty()) done_ = true;
        out = current_;
        return true;
    }

    // odometer step: bump the fastest axis that still has values left and
    // rewind every faster axis to its first value
    for (std::size_t i = name_props_.size(); i-- > 0;) {
        const auto& values = variations_->get(name_props_[i]);
        if (cursor_[i] + 1 >= values.size()) continue;

        ++cursor_[i];
        current_.set(name_props_[i], std::string_view(values[cursor_[i]]));
        for (std::size_t j = i + 1; j < name_props_.size(); ++j) {
            cursor_[j] = 0;
            current_.set(name_props_[j], std::string_view(variations_->get(name_props_[j]).front()));
        }

        update_name_();
        out = current_;
        return true;
    }

    done_ = true;
    return false;
}

} // namespace tsbase::unit
