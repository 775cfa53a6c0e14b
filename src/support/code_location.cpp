//===----------------------------------------------------------------------===//
//
// Part of the ClassLens project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the out-of-line validity query for the CodeLoc value type.  A
// location is valid when it was produced by CodeLoc::at(); default-constructed
// locations describe diagnostics that are not tied to a particular
// instruction, such as file loading errors reported by the tools.
//
//===----------------------------------------------------------------------===//

#include "support/code_location.hpp"

namespace classlens::support
{
/// @brief Determine whether the location carries a real code offset.
///
/// @details Offset zero is a legitimate instruction position, so validity is
///          tracked by an explicit flag instead of a sentinel offset.
///
/// @return True when the location names a byte inside a code buffer.
bool CodeLoc::isValid() const
{
    return known;
}
} // namespace classlens::support
