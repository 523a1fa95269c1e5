#include <replidoc-cpp/patch.hpp>

#include <algorithm>

namespace replidoc_cpp {

auto equivalent(const Diff& a, const Diff& b) -> bool {
    if (a.index() != b.index()) return false;
    if (const auto* va = as_value(a)) {
        return *va == *as_value(b);
    }
    const auto* oa = as_object(a);
    const auto* ob = as_object(b);
    if (oa == ob) return true;
    if (!oa || !ob) return false;
    return equivalent(*oa, *ob);
}

auto equivalent(const ObjectDiff& a, const ObjectDiff& b) -> bool {
    if (a.object_id != b.object_id || a.type != b.type || a.edits != b.edits) {
        return false;
    }
    if (a.props.has_value() != b.props.has_value()) return false;
    if (!a.props) return true;
    return std::ranges::equal(*a.props, *b.props, [](const auto& pa, const auto& pb) {
        return pa.first == pb.first
            && std::ranges::equal(pa.second, pb.second, [](const auto& wa, const auto& wb) {
                   return wa.first == wb.first && equivalent(wa.second, wb.second);
               });
    });
}

}  // namespace replidoc_cpp
