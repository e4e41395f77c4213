#ifndef __PE_CONTROL_CHARS__
#define __PE_CONTROL_CHARS__

#include "Headers.hpp"

namespace pe {
/**
 * @brief Maps the letter of a control key to the byte it produces, so 'c'
 * (or 'C') gives 3 for ^C.  Letters a-z map to 1-26 and the punctuation
 * keys follow the usual terminal conventions.
 * @return nullopt for keys with no control code.
 */
optional<char> controlCode(char key);
}  // namespace pe

#endif  // __PE_CONTROL_CHARS__
