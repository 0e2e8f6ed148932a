#include "exttypes/extension_type.hpp"

#include <atomic>

namespace autojit::exttypes {

namespace {

std::atomic<uint64_t> next_class_id{1};

} // namespace

ExtensionType::ExtensionType(std::string class_name)
    : class_name_(std::move(class_name)), class_id_(next_class_id.fetch_add(1)) {}

void ExtensionType::add_method(MethodEntry entry) {
    if (auto index = find_method(entry.name)) {
        methods_[*index] = std::move(entry);
        return;
    }
    methods_.push_back(std::move(entry));
}

std::optional<size_t> ExtensionType::find_method(const std::string& name) const {
    for (size_t i = 0; i < methods_.size(); ++i) {
        if (methods_[i].name == name)
            return i;
    }
    return std::nullopt;
}

} // namespace autojit::exttypes
