#include "db/HttpParser.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <strings.h>

#include <cmath>
#include <map>

namespace sketchdb {
namespace db {

const char* PENDING_MESSAGE = "Sketch data not yet available. Try again later.";

namespace {

typedef rapidjson::Writer<rapidjson::StringBuffer> JsonWriter;
// Batches may carry NaN values, which the ingest parser accepts.
typedef rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>,
                          rapidjson::UTF8<>, rapidjson::CrtAllocator,
                          rapidjson::kWriteNanAndInfFlag>
    BatchWriter;

// Exact key first, then any case.
const rapidjson::Value* member(const rapidjson::Value& obj, const char* name) {
  rapidjson::Value::ConstMemberIterator it = obj.FindMember(name);
  if (it != obj.MemberEnd()) return &it->value;
  for (it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
    if (strcasecmp(it->name.GetString(), name) == 0) return &it->value;
  }
  return nullptr;
}

error::Error parse_document(const std::string& body, rapidjson::Document* d) {
  d->Parse<rapidjson::kParseNanAndInfFlag>(body.c_str(), body.size());
  if (d->HasParseError())
    return error::Error(
        std::string("invalid JSON payload: ") +
        rapidjson::GetParseError_En(d->GetParseError()) + " at offset " +
        std::to_string(d->GetErrorOffset()));
  if (!d->IsObject()) return error::Error("invalid JSON payload: not an object");
  return error::Error();
}

void parse_metric(const rapidjson::Value& v, partition::MetricSample* m) {
  if (!v.IsObject()) {
    m->err.set("metric is not an object");
    return;
  }
  const rapidjson::Value* name = member(v, "Name");
  if (name == nullptr || !name->IsString()) {
    m->err.set("metric has no name");
    return;
  }
  m->name = name->GetString();

  const rapidjson::Value* labels = member(v, "Labels");
  if (labels != nullptr && !labels->IsNull()) {
    if (!labels->IsObject()) {
      m->err.set("labels of " + m->name + " is not an object");
      return;
    }
    for (auto it = labels->MemberBegin(); it != labels->MemberEnd(); ++it) {
      if (!it->value.IsString()) {
        m->err.set("label " + std::string(it->name.GetString()) + " of " +
                   m->name + " is not a string");
        return;
      }
      m->labels.emplace_back(it->name.GetString(), it->value.GetString());
    }
    label::lbs_normalize(&m->labels);
  }

  const rapidjson::Value* value = member(v, "Value");
  if (value == nullptr || !value->IsNumber()) {
    m->err.set("value of " + m->name + " is missing or not a number");
    return;
  }
  m->value = value->GetDouble();
}

// NaN and infinities fail both comparisons.
bool in_int64_range(double d) {
  return d >= -9223372036854775808.0 && d < 9223372036854775808.0;
}

template <typename Writer>
void write_string(Writer* w, const char* key, const std::string& value) {
  w->Key(key);
  w->String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

}  // namespace

/**********************************************
 *                IngestBatch                 *
 **********************************************/
error::Error parse_ingest(const std::string& body,
                          partition::IngestBatch* batch) {
  rapidjson::Document d;
  error::Error err = parse_document(body, &d);
  if (err) return err;

  const rapidjson::Value* ts = member(d, "Timestamp");
  if (ts == nullptr) return error::Error("missing Timestamp");
  if (ts->IsInt64())
    batch->timestamp = ts->GetInt64();
  else if (ts->IsNumber() && in_int64_range(ts->GetDouble()))
    batch->timestamp = static_cast<int64_t>(ts->GetDouble());
  else if (ts->IsNumber())
    return error::Error("Timestamp out of range");
  else
    return error::Error("Timestamp is not a number");

  batch->metrics.clear();
  const rapidjson::Value* metrics = member(d, "Metrics");
  if (metrics == nullptr || metrics->IsNull()) return error::Error();
  if (!metrics->IsArray()) return error::Error("Metrics is not an array");
  batch->metrics.resize(metrics->Size());
  for (rapidjson::SizeType i = 0; i < metrics->Size(); i++)
    parse_metric((*metrics)[i], &batch->metrics[i]);
  return error::Error();
}

std::string batch_json(const partition::IngestBatch& batch) {
  rapidjson::StringBuffer sb;
  BatchWriter w(sb);
  w.StartObject();
  w.Key("Timestamp");
  w.Int64(batch.timestamp);
  w.Key("Metrics");
  w.StartArray();
  for (const partition::MetricSample& m : batch.metrics) {
    w.StartObject();
    write_string(&w, "Name", m.name);
    w.Key("Labels");
    w.StartObject();
    for (const label::Label& l : m.labels)
      write_string(&w, l.label.c_str(), l.value);
    w.EndObject();
    w.Key("Value");
    w.Double(m.value);
    w.EndObject();
  }
  w.EndArray();
  w.EndObject();
  return sb.GetString();
}

std::string ingest_json(int count) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  write_string(&w, "status", "success");
  w.Key("ingested_metrics_count");
  w.Int(count);
  w.EndObject();
  return sb.GetString();
}

/**********************************************
 *                Registration                *
 **********************************************/
error::Error parse_register(const std::string& body, int64_t* estimated,
                            int64_t* machines_per_port) {
  rapidjson::Document d;
  error::Error err = parse_document(body, &d);
  if (err) return err;

  const rapidjson::Value* e = member(d, "estimated_timeseries");
  if (e == nullptr || !e->IsInt64())
    return error::Error("estimated_timeseries must be an integer");
  *estimated = e->GetInt64();

  const rapidjson::Value* mpp = member(d, "machines_per_port");
  if (mpp != nullptr && !mpp->IsNull()) {
    if (!mpp->IsInt64())
      return error::Error("machines_per_port must be an integer");
    *machines_per_port = mpp->GetInt64();
  }
  return error::Error();
}

std::string register_json(const control::PartitionPlan& plan) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  write_string(&w, "status", "success");
  w.Key("ports_active");
  w.StartArray();
  for (int port : plan.ports) w.Int(port);
  w.EndArray();
  w.Key("machines_per_port");
  w.Int64(plan.machines_per_partition);
  w.Key("partitions");
  w.Int(plan.partitions);
  w.Key("created");
  w.Int(plan.created);
  w.EndObject();
  return sb.GetString();
}

/**********************************************
 *                   Query                    *
 **********************************************/
std::string query_json(const query::QueryResult& result) {
  if (result.status == query::QUERY_ERROR) return error_json(result.err.error());
  if (result.status == query::QUERY_PENDING) return pending_json();

  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  write_string(&w, "status", "success");
  w.Key("data");
  w.StartArray();
  for (const sketch::Sample& s : result.data) {
    w.StartObject();
    w.Key("value");
    w.Double(s.v);
    w.Key("timestamp");
    w.Int64(s.t);
    w.EndObject();
  }
  w.EndArray();
  if (!result.annotations.empty()) {
    w.Key("annotations");
    w.StartObject();
    for (const auto& p : result.annotations)
      write_string(&w, p.first.c_str(), p.second);
    w.EndObject();
  }
  w.Key("query_latency_ms");
  w.Double(result.latency_ms);
  w.EndObject();
  return sb.GetString();
}

/**********************************************
 *                   Debug                    *
 **********************************************/
std::string debug_state_json(const control::DebugState& state) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  write_string(&w, "status", "success");
  w.Key("timestamp");
  w.Int64(state.timestamp);
  w.Key("machines_per_port");
  w.Int64(state.machines_per_partition);
  w.Key("partitions_active");
  w.Int(static_cast<int>(state.partitions.size()));
  w.Key("partitions");
  w.StartArray();
  for (const control::PartitionReport& r : state.partitions) {
    w.StartObject();
    w.Key("index");
    w.Int(r.assignment.index);
    write_string(&w, "host", r.assignment.host);
    w.Key("port");
    w.Int(r.assignment.port);
    w.Key("machine_range");
    w.StartArray();
    w.Int64(r.assignment.machine_begin);
    w.Int64(r.assignment.machine_end);
    w.EndArray();
    if (!r.reachable) {
      write_string(&w, "status", "degraded");
      write_string(&w, "error", r.error);
      w.EndObject();
      continue;
    }
    write_string(&w, "status", "ok");
    w.Key("sketch_count");
    w.Uint64(r.summary.sketches());
    w.Key("ingested_total");
    w.Uint64(r.summary.ingested_total());
    w.Key("failed_total");
    w.Uint64(r.summary.failed_total());
    w.Key("last_insert_ms");
    w.Int64(r.summary.last_insert_ms());

    std::map<std::string, std::vector<const InstanceSummary*>> machines;
    for (int i = 0; i < r.summary.instances_size(); i++)
      machines[r.summary.instances(i).machine()].push_back(
          &r.summary.instances(i));
    w.Key("machines");
    w.StartObject();
    for (const auto& m : machines) {
      w.Key(m.first.c_str());
      w.StartArray();
      for (const InstanceSummary* is : m.second) {
        w.StartObject();
        write_string(&w, "function", is->function());
        write_string(&w, "series", is->labels());
        w.Key("samples");
        w.Uint64(is->samples());
        w.Key("min_time");
        w.Int64(is->min_time());
        w.Key("max_time");
        w.Int64(is->max_time());
        w.EndObject();
      }
      w.EndArray();
    }
    w.EndObject();
    w.EndObject();
  }
  w.EndArray();
  w.EndObject();
  return sb.GetString();
}

std::string error_json(const std::string& msg) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  write_string(&w, "status", "error");
  write_string(&w, "error", msg);
  w.EndObject();
  return sb.GetString();
}

std::string pending_json() {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  write_string(&w, "status", "pending");
  write_string(&w, "message", PENDING_MESSAGE);
  w.EndObject();
  return sb.GetString();
}

std::string health_json(const std::string& message) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  write_string(&w, "status", "UP");
  write_string(&w, "message", message);
  w.EndObject();
  return sb.GetString();
}

}  // namespace db
}  // namespace sketchdb
