#ifndef UTIL_NOTEBOOK_HPP
#define UTIL_NOTEBOOK_HPP

#include <string>

namespace util {

// Converts a Jupyter notebook to a plain script: the sources of the code
// cells, in order, one cell after the other. Lines starting with % or !
// (magics and shell escapes) are commented out. Throws a kj exception if
// json is not a notebook.
std::string NotebookToScript(const std::string& json);

}  // namespace util

#endif
