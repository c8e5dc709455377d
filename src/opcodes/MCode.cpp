#include "dotmatrix/opcodes/MCode.hpp"

#include <type_traits>

namespace dotmatrix::opcodes {

std::string_view mcodeName(const MCode& mcode) {
    return std::visit(
        overloaded{
            [](const ChangeBit& value) { return value.set ? ChangeBit::setName : ChangeBit::name; },
            [](const ChangeBitMemory& value) {
                return value.set ? ChangeBitMemory::setName : ChangeBitMemory::name;
            },
            [](const auto& value) { return std::decay_t<decltype(value)>::name; },
        },
        mcode);
}

}  // namespace dotmatrix::opcodes
