//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "prog_option.h"

namespace arena::cli {

namespace fs = std::filesystem;

struct batch_job_t {
    std::string agent_id;
    std::string challenge_id;
    fs::path payload;
    fs::path source;
};

// Every `dir/<agent>/<challenge>/` holding both payload.bin and decompress.py, sorted by
// agent then challenge.
std::vector<batch_job_t> find_batch_jobs(const fs::path &dir);

class CliHandler {
  public:
    CliHandler();
    // Returns the exit status: 0 ok, 1 rejected or failed submission, 2 usage or setup error.
    int run(int argc, char **argv);

  private:
    po::CommandHandler handler_;
};

}  // namespace arena::cli
