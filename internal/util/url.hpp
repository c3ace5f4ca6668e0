#pragma once

#include <string_view>

namespace feedstore::util {

/*
  Syntactic URL check.

    url    = scheme ":" rest
    scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
    rest   = 1*( any printable character except whitespace )

  No normalisation is performed; the stored form is the caller's form.
*/
bool IsValidUrl(std::string_view url);

} // namespace feedstore::util
