#pragma once
#include <string>
#include <string_view>

namespace sr {

class JobConf;
class PartitionTable;

// Job description files are JSON:
//   { "properties": { "<key>": "<value>", ... },
//     "partitions": [ { "path": "<prefix>", "properties": { ... } }, ... ] }
// Both members are optional. Key order is preserved, so partitions keep
// file order. On failure returns false and leaves a message in *err.
bool load_job_json(std::string_view json, JobConf* conf, PartitionTable* parts,
                   std::string* err = nullptr);

bool load_job_file(const std::string& path, JobConf* conf, PartitionTable* parts,
                   std::string* err = nullptr);

}
