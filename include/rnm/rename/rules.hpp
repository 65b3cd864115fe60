#pragma once
// Concrete manipulate rules for RenameEngine.

#include <string>

#include "rnm/rename/engine.hpp"

namespace rnm {

// IEEE 1800-2017 Annex B reserved words.
const Namespace::NameSet& verilogKeywords();

// Names found in `keywords` get the '_' delimiter appended until the result
// is free in the scope and is not itself a keyword: reg -> reg_ (reg__ ...).
ManipulateRule makeKeywordRule(Namespace::NameSet keywords);
ManipulateRule makeVerilogRenameRule();

// Case conversion; a converted name that is taken becomes name_0, name_1 ...
ManipulateRule makeLowerCaseRule();
ManipulateRule makeUpperCaseRule();

ManipulateRule makePrefixRule(std::string prefix);

} // namespace rnm
