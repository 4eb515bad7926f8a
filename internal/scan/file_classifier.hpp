#pragma once

#include <string>
#include <string_view>

#include "internal/model/category.hpp"

namespace uploader::scan {

/*
  Extension → category lookup.

  Tables are checked in order raw, image, video; anything else is OTHER.
  Matching is case-insensitive and accepts the extension with or without
  its leading dot.
*/
model::FileCategory Classify(std::string_view extension);

// MIME type sent with the object; application/octet-stream when unknown.
std::string_view ContentTypeFor(std::string_view extension);

// ".JPG" / "JPG" → ".jpg"; "" stays "".
std::string NormalizeExtension(std::string_view extension);

} // namespace uploader::scan
