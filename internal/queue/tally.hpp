#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/status/status.hpp"

namespace rowqueue::queue {

// Rows per state, read in one transaction. Every state has an entry.
std::map<status::State, uint64_t> Tally(db::Repository& repository, const db::QueueColumn& column);

std::map<status::State, uint64_t> Tally(db::Repository& repository, const std::string& rows, const std::string& field);

} // namespace rowqueue::queue
