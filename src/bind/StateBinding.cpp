//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements state-mode resolution for bound functions.
//
//===----------------------------------------------------------------------===//

#include "bind/StateBinding.hpp"

#include "bind/TypeClass.hpp"
#include "bind/TypeNames.hpp"

namespace tether::bind
{

std::string StateSpec::paramCppType() const
{
    if (sharedWrapper)
        return "const std::shared_ptr<" + innerCpp() + "> &";
    return innerCpp() + " &";
}

std::string StateSpec::innerCpp() const
{
    return inner.cppSpelling();
}

std::string StateSpec::callArgument() const
{
    return sharedWrapper ? "state" : "*state";
}

support::Expected<StateSpec> resolveStateSpec(const TypeRef &stateType,
                                              bool fastRequested,
                                              support::SourceLoc loc)
{
    StateSpec spec;
    switch (names::modeWrapper(stateType))
    {
        case names::ModeWrapper::Slot:
            spec.mode = StateMode::SharedSlot;
            spec.explicitMode = true;
            spec.declared = stateType.args.front();
            break;
        case names::ModeWrapper::Capsule:
            spec.mode = StateMode::PinnedCapsule;
            spec.explicitMode = true;
            spec.declared = stateType.args.front();
            break;
        case names::ModeWrapper::None:
            spec.mode = fastRequested ? StateMode::PinnedCapsule : StateMode::SharedSlot;
            spec.declared = stateType;
            break;
    }

    if (names::isShared(spec.declared))
    {
        spec.sharedWrapper = true;
        spec.inner = spec.declared.args.front();
    }
    else
    {
        spec.inner = spec.declared;
    }

    // The state object is addressed by pointer; primitives, engine handles and
    // optionals have no stable identity to share.
    const TypeClass cls = classify(spec.inner, ClassifyContext::State);
    if (spec.inner.isUnit() || cls.tag() != TypeClass::Tag::Opaque)
        return support::makeConfigError(loc,
                                        "state type '" + spec.declared.display() +
                                            "' must name a class type, got " + cls.describe());
    return spec;
}

const char *stateModeName(StateMode mode)
{
    return mode == StateMode::SharedSlot ? "SharedSlot" : "PinnedCapsule";
}

} // namespace tether::bind
