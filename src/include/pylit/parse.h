#pragma once

#include <pylit/parse_error.h>
#include <pylit/value.h>
#include <string>

namespace pylit {

// Parse the text of one Python literal: None, True, False, numbers (with an
// optional sign and the real+imagj form), str and bytes literals, and
// tuple/list/set/dict displays of literals. Surrounding whitespace and '#'
// comments are ignored; anything else left over is an error.
// Collections nest at most 1000 levels deep.
// Throws pylit::ParseError. When `verbose` is true, the outcome (or the error
// message) is also written to std::cerr.
Value parse(const std::string& text, bool verbose = false);

}  // namespace pylit
