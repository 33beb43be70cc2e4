#include <jsondiff-cpp/patch.hpp>

namespace jsondiff_cpp {

auto op_name(const PatchOp& op) noexcept -> std::string_view {
    return std::visit(overload{
        [](const PatchAdd&) -> std::string_view { return "add"; },
        [](const PatchRemove&) -> std::string_view { return "remove"; },
        [](const PatchReplace&) -> std::string_view { return "replace"; },
        [](const PatchMove&) -> std::string_view { return "move"; },
        [](const PatchCopy&) -> std::string_view { return "copy"; },
        [](const PatchTest&) -> std::string_view { return "test"; },
    }, op);
}

auto op_path(const PatchOp& op) noexcept -> const Pointer& {
    return std::visit([](const auto& o) -> const Pointer& { return o.path; }, op);
}

}  // namespace jsondiff_cpp
