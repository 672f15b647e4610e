#include "requests.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "util.hpp"

using namespace std;
using json = nlohmann::json;

static const char* SERVICE_NAME = "fleet-optimizer";
static const char* SERVICE_VERSION = "1.0.0";

json optimize_to_json(const OptimizeOutput& out)
{
    json j;
    j["optimization_id"] = out.optimization_id;
    j["result"] = assignment_to_json(out.result, out.timestamp);
    j["recommendations"] = out.recommendations;
    return j;
}

static json handle_optimize(FleetOptimizer& engine, const json& q)
{
    auto deliveries = parse_deliveries(q);
    auto vehicles = parse_vehicles(q);
    return optimize_to_json(engine.optimize(deliveries, vehicles));
}

static json handle_fuel(FleetOptimizer& engine, const json& q)
{
    Vehicle v = parse_fuel_vehicle(q);
    double distance = number_field(q, "route_distance", 0.0);
    return json(engine.fuel_efficiency(v, distance));
}

static json handle_recommendations(FleetOptimizer& engine)
{
    auto recs = engine.recommendations();
    json j;
    j["recommendations"] = recs;
    j["total_count"] = recs.size();
    j["timestamp"] = iso_timestamp();
    return j;
}

static json handle_history(FleetOptimizer& engine, const json& q)
{
    int limit = integer_field(q, "limit", engine.config().default_history_limit);
    auto runs = engine.history(limit);
    json j;
    j["history"] = runs;
    j["total_count"] = engine.ledger().count();
    j["showing"] = runs.size();
    return j;
}

static json handle_health(FleetOptimizer& engine)
{
    return {
        {"status", "healthy"},
        {"timestamp", iso_timestamp()},
        {"service", SERVICE_NAME},
        {"version", SERVICE_VERSION},
        {"vehicles_registered", engine.registered_vehicles()},
        {"runs_recorded", engine.ledger().count()},
        {"ledger_capacity", engine.ledger().capacity()}
    };
}

json process_request(FleetOptimizer& engine, const json& request)
{
    json result;
    json id;
    if (request.is_object() && request.contains("id")) id = request["id"];

    try {
        if (!request.is_object() || !request.contains("type") || !request["type"].is_string())
            throw ValidationError("request must be an object with a string 'type'");

        string type = request["type"];
        if (type == "optimize") {
            result = handle_optimize(engine, request);
        } else if (type == "fuel_efficiency") {
            result = handle_fuel(engine, request);
        } else if (type == "recommendations") {
            result = handle_recommendations(engine);
        } else if (type == "history") {
            result = handle_history(engine, request);
        } else if (type == "health") {
            result = handle_health(engine);
        } else {
            result = {{"error", "unknown request type"}, {"status", "failed"}};
        }
    } catch (const ValidationError& e) {
        result = {{"error", e.what()}, {"status", "rejected"}};
    } catch (const json::exception& e) {
        result = {{"error", e.what()}, {"status", "rejected"}};
    } catch (const ComputationError& e) {
        result = {{"error", e.what()}, {"status", "failed"}};
    } catch (const exception& e) {
        result = {{"error", string("internal error: ") + e.what()}, {"status", "failed"}};
    }

    result["id"] = id;
    return result;
}
