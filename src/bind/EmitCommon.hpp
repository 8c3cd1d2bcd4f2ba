//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: bind/EmitCommon.hpp
// Purpose: Naming and prototype helpers shared by the slow-path, fast-path
//          and module emitters.
// Key invariants: Symbol names are a pure function of the native function
//                 name, so a header and source emitted separately agree.
// Links: docs/manifest-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bind/GenerationPlan.hpp"

#include <string>

namespace tether::bind
{

/// @brief Emitted symbol names for one function `f`.
struct BindingSymbols
{
    std::string native;    ///< f
    std::string callback;  ///< f_callback
    std::string fast;      ///< f_fast
    std::string fastArgs;  ///< kFFastCallArgs (source-local)
    std::string fastInfo;  ///< kFFastCallInfo
    std::string fastCall;  ///< kFFastCall
    std::string templ;     ///< f_template
};

BindingSymbols symbolsFor(const std::string &nativeName);

/// @brief Fully qualified host-contract type, e.g. `tether::host::Scope`.
std::string hostType(const char *name);

/// @brief `RET name(PARAMS)` of the user-supplied native function.
std::string nativePrototype(const GenerationPlan &plan);

/// @brief `void f_callback(Scope &scope, const CallbackArgs &args, ReturnValue &rv)`.
std::string callbackPrototype(const BindingSymbols &symbols);

/// @brief Prototype of the registration helper.
std::string templatePrototype(const GenerationPlan &plan, const BindingSymbols &symbols);

/// @brief Name of the slow-path local holding argument @p index.
std::string argLocal(int index);

} // namespace tether::bind
