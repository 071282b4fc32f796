#include "proxyrot/repository/RotationConfigRepository.hpp"
#include "proxyrot/Errors.hpp"
#include "proxyrot/config/RotationConfigCodec.hpp"
#include "proxyrot/repository/SqlUtils.hpp"
#include "proxyrot/util/JsonUtil.hpp"
#include "proxyrot/util/Logging.hpp"

#include <boost/json.hpp>

namespace proxyrot::repository {
namespace {

constexpr const char* kConfigColumns =
    "SELECT id, name, strategy, strategy_config, target_group, priority, enabled FROM rotation_configs";

boost::json::value parseJsonColumn(const mysqlx::Value& value, const std::string& column, boost::json::value fallback) {
    auto text = readString(value);
    if (text.empty()) {
        return fallback;
    }
    try {
        return util::parseJson(text);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::warn, "JSON parse failed on column " + column + ": " + ex.what());
        return fallback;
    }
}

} // namespace

RotationConfigRepository::RotationConfigRepository(MySqlConnectionPool& pool)
    : pool_(pool) {}

std::optional<model::RotationConfig> RotationConfigRepository::getActiveConfig(
    const std::optional<std::string>& targetGroup) {
    auto session = pool_.acquire();
    try {
        std::string sql = std::string{kConfigColumns} + " WHERE is_active = 1 AND enabled = 1 AND ";
        sql += targetGroup ? "target_group = ?" : "target_group IS NULL";
        sql += " ORDER BY priority DESC LIMIT 1";
        auto stmt = session->sql(sql);
        if (targetGroup) {
            stmt.bind(*targetGroup);
        }
        auto rows = stmt.execute();
        for (mysqlx::Row row : rows) {
            return mapRow(*session, row);
        }
    } catch (const mysqlx::Error& err) {
        session.markBroken();
        util::log(util::LogLevel::error, std::string{"Query active rotation config failed: "} + err.what());
        throw;
    }
    return std::nullopt;
}

std::optional<model::RotationConfig> RotationConfigRepository::findById(const std::string& configId) {
    auto session = pool_.acquire();
    try {
        auto rows = session->sql(std::string{kConfigColumns} + " WHERE id = ?").bind(configId).execute();
        for (mysqlx::Row row : rows) {
            return mapRow(*session, row);
        }
    } catch (const mysqlx::Error& err) {
        session.markBroken();
        util::log(util::LogLevel::error, std::string{"Query rotation config failed: "} + err.what());
        throw;
    }
    return std::nullopt;
}

std::optional<model::RotationConfig> RotationConfigRepository::mapRow(mysqlx::Session& session, mysqlx::Row row) {
    boost::json::object json{
        {"id", readString(row[0])},
        {"name", readString(row[1])},
        {"strategy", readString(row[2])},
        {"priority", readInteger(row[5])},
        {"enabled", readFlag(row[6], true)},
    };
    auto params = parseJsonColumn(row[3], "strategy_config", boost::json::object{});
    if (params.is_object()) {
        json["params"] = params;
    }
    if (auto group = readOptionalString(row[4])) {
        json["targetGroup"] = *group;
    }

    auto config = config::parseRotationConfig(json);
    if (auto custom = std::get_if<model::CustomParams>(&config.params)) {
        auto stored = loadRules(session, config.id);
        custom->rules.insert(custom->rules.end(), stored.begin(), stored.end());
        config::sortRules(custom->rules);
    }
    return config;
}

std::vector<model::Rule> RotationConfigRepository::loadRules(mysqlx::Session& session, const std::string& configId) {
    std::vector<model::Rule> rules;
    auto rows = session
                    .sql("SELECT id, name, priority, conditions, condition_logic, actions, stop_on_match, enabled "
                         "FROM proxy_rotation_rules WHERE config_id = ? ORDER BY priority DESC")
                    .bind(configId)
                    .execute();
    for (mysqlx::Row row : rows) {
        boost::json::object json{
            {"id", readString(row[0])},
            {"name", readString(row[1])},
            {"priority", readInteger(row[2])},
            {"conditions", parseJsonColumn(row[3], "conditions", boost::json::array{})},
            {"logic", readString(row[4]).empty() ? std::string{"AND"} : readString(row[4])},
            {"actions", parseJsonColumn(row[5], "actions", boost::json::array{})},
            {"stopOnMatch", readFlag(row[6], true)},
            {"enabled", readFlag(row[7], true)},
        };
        try {
            rules.push_back(config::parseRule(json));
        } catch (const InvalidConfigError& ex) {
            util::log(util::LogLevel::warn, "Skipping rotation rule " + readString(row[0]) + ": " + ex.what());
        }
    }
    return rules;
}

} // namespace proxyrot::repository
