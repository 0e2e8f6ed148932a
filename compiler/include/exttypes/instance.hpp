//! # Extension Instances
//!
//! An instance owns zero-initialized storage laid out by its class's
//! attribute struct. Native methods receive a pointer to that storage as
//! their receiver.

#pragma once

#include "types/type.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace autojit::exttypes {

class ClassDescriptor;

class Instance {
public:
    explicit Instance(std::shared_ptr<const ClassDescriptor> descriptor);

    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    [[nodiscard]] uint8_t* data() {
        return reinterpret_cast<uint8_t*>(storage_.get());
    }
    [[nodiscard]] const uint8_t* data() const {
        return reinterpret_cast<const uint8_t*>(storage_.get());
    }

    [[nodiscard]] const std::shared_ptr<const ClassDescriptor>& descriptor() const {
        return descriptor_;
    }

    [[nodiscard]] std::string class_name() const;

    /// `instance(C)` bound to this instance's class, or null without one.
    [[nodiscard]] types::TypePtr instance_type() const;

private:
    std::shared_ptr<const ClassDescriptor> descriptor_;
    std::unique_ptr<std::max_align_t[]> storage_;
};

} // namespace autojit::exttypes
