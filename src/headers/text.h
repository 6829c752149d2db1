#pragma once
/**
 * Memeforge - Text slug codec
 *
 * A slug carries overlay lines in a URL path: lines are separated by "/",
 * spaces are "_" or "-", and reserved characters use "~" escapes:
 *
 *   __ -> _     -- -> -     '' -> "
 *   ~n -> newline   ~q -> ?   ~a -> &   ~p -> %   ~h -> #
 *   ~s -> /         ~b -> \   ~l -> <   ~g -> >
 *
 * A blank line is written as "_".
 */

#include "common.h"

vector<string> text_decode(const string& slug);
string         text_encode(const vector<string>& lines);

// Canonical form of a slug; `second` is true when it differs from the input.
pair<string, bool> text_normalize(const string& slug);

// First `max_chars` code points of `s` (never splits a UTF-8 sequence).
string utf8_truncate(const string& s, size_t max_chars);
