#include <cstdlib>
#include <ctime>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "core/geodesy.h"
#include "core/geofence_engine.h"
#include "database/database_manager.h"
#include "database/zone_dao.h"
#include "service/approval_workflow.h"

void print_usage() {
    std::cout << "Usage:" << std::endl;
    std::cout << "  db_tool init <db_path>" << std::endl;
    std::cout << "  db_tool add_zone <db_path> <name> <lat> <lng> <radius_m> [methods=face,gps,manual]" << std::endl;
    std::cout << "  db_tool list_zones <db_path>" << std::endl;
    std::cout << "  db_tool disable_zone <db_path> <zone_id>" << std::endl;
    std::cout << "  db_tool match <db_path> <lat> <lng>" << std::endl;
    std::cout << "  db_tool list_pending <db_path>" << std::endl;
    std::cout << "  db_tool decide <db_path> <request_id> <approve|reject> [manager_id]" << std::endl;
    std::cout << "  db_tool stats <db_path>" << std::endl;
}

bool parse_double(const char* text, double& out) {
    char* end = nullptr;
    out = std::strtod(text, &end);
    return end != text && *end == '\0';
}

bool parse_int64(const char* text, int64_t& out) {
    char* end = nullptr;
    out = std::strtoll(text, &end, 10);
    return end != text && *end == '\0';
}

std::string format_time(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    std::string db_path = argv[2];

    if (!db::DatabaseManager::instance().open(db_path)) {
        std::cerr << "Failed to open database: " << db_path << std::endl;
        return 1;
    }

    if (command == "init") {
        std::cout << "Database initialized successfully at " << db_path << std::endl;
    }
    else if (command == "add_zone") {
        if (argc < 7) {
            std::cout << "Usage: db_tool add_zone <db_path> <name> <lat> <lng> <radius_m> [methods]" << std::endl;
            return 1;
        }
        db::GeofenceZone zone;
        zone.name = argv[3];
        if (!parse_double(argv[4], zone.center_lat) || !parse_double(argv[5], zone.center_lng) ||
            !parse_double(argv[6], zone.radius_meters)) {
            std::cerr << "Invalid coordinates or radius." << std::endl;
            return 1;
        }
        if (argc >= 8) {
            auto methods = db::parse_punch_methods(argv[7]);
            if (methods && !methods->empty()) {
                zone.allowed_methods = *methods;
            } else {
                std::cerr << "Invalid methods: " << argv[7] << std::endl;
                return 1;
            }
        }

        db::ZoneDao dao;
        int64_t id = dao.add_zone(zone);
        if (id != -1) {
            std::cout << "Zone added. ID: " << id << std::endl;
        } else {
            std::cerr << "Failed to add zone." << std::endl;
            return 1;
        }
    }
    else if (command == "list_zones") {
        db::ZoneDao dao;
        auto zones = dao.get_all_zones();
        std::cout << "ID\tName\tLat\tLng\tRadius\tActive\tMethods" << std::endl;
        for (const auto& z : zones) {
            std::cout << z.zone_id << "\t" << z.name << "\t" << z.center_lat << "\t" << z.center_lng << "\t"
                      << core::format_distance(z.radius_meters) << "\t" << (z.is_active ? "yes" : "no") << "\t"
                      << db::format_punch_methods(z.allowed_methods) << std::endl;
        }
    }
    else if (command == "disable_zone") {
        int64_t id = 0;
        if (argc < 4 || !parse_int64(argv[3], id)) {
            std::cout << "Usage: db_tool disable_zone <db_path> <zone_id>" << std::endl;
            return 1;
        }
        db::ZoneDao dao;
        if (!dao.set_active(id, false)) {
            std::cerr << "Zone " << id << " not found." << std::endl;
            return 1;
        }
        std::cout << "Zone " << id << " disabled." << std::endl;
    }
    else if (command == "match") {
        db::LocationFix fix;
        if (argc < 5 || !parse_double(argv[3], fix.latitude) || !parse_double(argv[4], fix.longitude)) {
            std::cout << "Usage: db_tool match <db_path> <lat> <lng>" << std::endl;
            return 1;
        }
        core::GeofenceEngine engine;
        engine.load_from_database();
        core::ZoneMatch m = engine.match(fix);
        if (!m.zone) {
            std::cout << "No active zone." << std::endl;
        } else {
            std::cout << "Nearest: " << m.zone->name << " (" << core::format_distance(m.distance_meters) << ")"
                      << (m.within_zone ? " within zone" : " outside zone") << std::endl;
        }
    }
    else if (command == "list_pending") {
        service::ApprovalWorkflow workflow;
        auto requests = workflow.pending();
        std::cout << "ID\tType\tUser\tManager\tRequested\tReason" << std::endl;
        for (const auto& r : requests) {
            std::cout << r.request_id << "\t" << db::to_string(r.type) << "\t" << r.user_id << "\t" << r.manager_id
                      << "\t" << format_time(r.requested_at) << "\t" << r.reason << std::endl;
        }
    }
    else if (command == "decide") {
        int64_t id = 0;
        if (argc < 5 || !parse_int64(argv[3], id)) {
            std::cout << "Usage: db_tool decide <db_path> <request_id> <approve|reject> [manager_id]" << std::endl;
            return 1;
        }
        std::string action = argv[4];
        if (action != "approve" && action != "reject") {
            std::cerr << "Unknown decision: " << action << std::endl;
            return 1;
        }
        std::optional<int64_t> manager;
        int64_t manager_id = 0;
        if (argc >= 6 && parse_int64(argv[5], manager_id)) {
            manager = manager_id;
        }

        service::ApprovalWorkflow workflow;
        auto decided = workflow.decide(id, action == "approve", manager);
        if (!decided.ok()) {
            std::cerr << core::to_string(decided.code()) << ": " << decided.message() << std::endl;
            return 1;
        }
        std::cout << "Request " << id << " " << db::to_string(decided->status) << "." << std::endl;
    }
    else if (command == "stats") {
        service::ApprovalWorkflow workflow;
        service::ApprovalStats s = workflow.stats();
        db::ZoneDao zdao;
        std::cout << "Zones: " << zdao.get_all_zones().size() << std::endl;
        std::cout << "Approval requests: " << s.total << " (pending " << s.pending << ", approved " << s.approved
                  << ", rejected " << s.rejected << ")" << std::endl;
        std::cout << "Approval rate: " << s.approval_rate << "%" << std::endl;
        std::cout << "Average response: " << s.average_response_hours << " h" << std::endl;
    }
    else {
        print_usage();
        return 1;
    }

    return 0;
}
