/**
 * @file StringList.cpp
 * @brief Implementation of StringList
 */

#include "envflag/StringList.hpp"
#include "envflag/Names.hpp"

namespace envflag {

void StringList::materialize() {
    if (raw_.empty()) {
        value_.clear();
        return;
    }
    value_ = split_with_comma(raw_);
}

} // namespace envflag
