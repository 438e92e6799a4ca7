#pragma once
#include "bcp_exorcist/options.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace bx {

// One job per line (JSON lines):
//   {"path": "a.csv", "delim": "\u001e", "newline": "0x1D",
//    "chunk_size": "1MiB", "carry_escape": false}
// Only "path" is required; missing keys come from `defaults`.
// Blank lines and lines starting with '#' are ignored.
//
// Every line is validated before anything is returned, so a bad manifest
// never leaves some files rewritten and others not.
bool load_manifest(const std::string& path,
                   const ExorcizeRequest& defaults,
                   std::vector<ExorcizeRequest>* jobs,
                   std::string* err_out = nullptr);

// Parses a single manifest line; used by load_manifest.
bool parse_manifest_line(std::string_view line,
                         const ExorcizeRequest& defaults,
                         ExorcizeRequest* job,
                         std::string* err_out = nullptr);

}
