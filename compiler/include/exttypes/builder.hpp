//! # Extension Type Builder
//!
//! Turns a class declaration into an immutable `ClassDescriptor`. The stages
//! run strictly in order and never backtrack:
//!
//! | # | Stage                | Produces                                      |
//! |---|----------------------|-----------------------------------------------|
//! | 1 | Inherit              | seed layout from the primary native base      |
//! | 2 | Collect signatures   | declared attributes, annotated method list    |
//! | 3 | Infer `__init__`     | types of attributes assigned in the ctor      |
//! | 4 | Attribute struct     | inherited fields, then first-seen new fields  |
//! | 5 | Infer methods        | return types of the remaining methods         |
//! | 6 | VTable type          | one slot per method, layouts verified         |
//! | 7 | Compile              | own methods compiled, inherited ones reused   |
//! | 8 | Accessors            | typed getter/setter per attribute             |
//! | 9 | Assemble             | the descriptor                                |
//!
//! Nothing is published on failure: the builder returns an error and the
//! caller registers the descriptor only on success.

#pragma once

#include "common.hpp"
#include "common/error.hpp"
#include "exttypes/class_descriptor.hpp"
#include "jit/pipeline.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace autojit::exttypes {

/// A base class. `native` is null for plain host classes, which contribute
/// nothing to the native layout.
struct BaseRef {
    std::string name;
    ClassDescriptorPtr native;
};

struct MethodDecl {
    jit::FunctionDecl decl; ///< Instance methods list the receiver in `params`
    std::optional<types::Signature> signature; ///< Annotation, receiver excluded
    MethodKind kind = MethodKind::Instance;
};

struct ClassDecl {
    std::string name;
    std::vector<BaseRef> bases;
    /// Class-level attribute type declarations, in declaration order.
    std::vector<std::pair<std::string, types::TypePtr>> attribute_types;
    std::vector<MethodDecl> methods;
};

/// Method annotations supplied next to the declaration (method name ->
/// signature without the receiver).
using ExplicitSignatures = std::vector<std::pair<std::string, types::Signature>>;

class ClassBuilder {
public:
    ClassBuilder(jit::PipelineAdapter& adapter, jit::CompileOptions options);

    [[nodiscard]] Result<ClassDescriptorPtr, JitError>
    build(const ClassDecl& decl, const ExplicitSignatures& explicit_signatures = {});

private:
    jit::PipelineAdapter& adapter_;
    jit::CompileOptions options_;
};

} // namespace autojit::exttypes
