#pragma once

#include <nftreg/Chain.hpp>

#include <rapidjson/document.h>

#include <iosfwd>
#include <string>

namespace nftreg
{
   /// Runs one entry of an action script against the registry on `chain`
   /// and returns its trace as a single line of JSON.
   ///
   /// A malformed entry (missing or invalid sender, unknown action, bad
   /// arguments) fails only this entry; its trace carries the error.
   std::string replayStep(Chain& chain, const rapidjson::Value& entry);

   /// Runs every entry of `script`, which must be an array, writing one
   /// trace per line to `out`
   void replay(Chain& chain, const rapidjson::Value& script, std::ostream& out);
}  // namespace nftreg
