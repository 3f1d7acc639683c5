#pragma once

#include <string>

#include "base/Error.hpp"
#include "control/ControlPlane.hpp"
#include "partition/IngestBatch.hpp"
#include "query/QueryEvaluator.hpp"

namespace sketchdb {
namespace db {

extern const char* PENDING_MESSAGE;

/**********************************************
 *                IngestBatch                 *
 **********************************************/
// parse_ingest decodes {"Timestamp": ms, "Metrics": [{"Name", "Labels",
// "Value"}]}. Keys match case-insensitively. A malformed metric entry is
// kept with its err set so that the rest of the batch still counts.
error::Error parse_ingest(const std::string& body,
                          partition::IngestBatch* batch);
std::string batch_json(const partition::IngestBatch& batch);
std::string ingest_json(int count);

/**********************************************
 *                Registration                *
 **********************************************/
// machines_per_port is left untouched when the body does not name it.
error::Error parse_register(const std::string& body, int64_t* estimated,
                            int64_t* machines_per_port);
std::string register_json(const control::PartitionPlan& plan);

/**********************************************
 *                   Query                    *
 **********************************************/
std::string query_json(const query::QueryResult& result);

/**********************************************
 *                   Debug                    *
 **********************************************/
std::string debug_state_json(const control::DebugState& state);

std::string error_json(const std::string& msg);
std::string pending_json();
std::string health_json(const std::string& message);

}  // namespace db
}  // namespace sketchdb
