//===----------------------------------------------------------------------===//
//
// Part of the Tether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements installation of generated binding tables.
//
//===----------------------------------------------------------------------===//

#include "tether/runtime/Binding.hpp"

namespace tether::runtime
{

Result<std::vector<std::string_view>, std::string> installBindings(
    host::Scope &scope, host::Local<host::Object> target, std::span<const BindingEntry> entries)
{
    using InstallResult = Result<std::vector<std::string_view>, std::string>;

    if (target.isEmpty())
        return InstallResult::failure(std::string("binding target is empty"));

    std::vector<std::string_view> skipped;
    for (const auto &entry : entries)
    {
        if (entry.needsCapsule)
        {
            skipped.push_back(entry.name);
            continue;
        }
        auto templ = scope.newFunctionTemplate(entry.callback, scope.undefined(), entry.fastCall);
        auto fn = templ->getFunction(scope);
        if (fn.isEmpty() || !target->set(scope, entry.name, fn))
            return InstallResult::failure("failed to install binding '" + std::string(entry.name) +
                                          "'");
    }
    return InstallResult::success(std::move(skipped));
}

} // namespace tether::runtime
