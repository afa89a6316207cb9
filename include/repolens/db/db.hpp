#pragma once
#include "repolens/core/logging.hpp"
#include "repolens/core/result.hpp"
#include "repolens/core/traits.hpp"

#include <cstddef>
#include <exception>
#include <expected>
#include <format>
#include <functional>
#include <memory>
#include <pqxx/pqxx>
#include <pqxx/zview>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace repolens::db {

static auto Log() { return core::logger("db"); }

// "$1, $2, ..., $Count"
inline std::string placeholders(std::size_t Count) {
  std::string Result;
  for (std::size_t I = 1; I <= Count; ++I) {
    Result += I == 1 ? std::format("${}", I) : std::format(", ${}", I);
  }
  return Result;
}

struct Database {
  pqxx::connection Cx;

  explicit Database(const std::string &ConnString) : Cx(ConnString) {}

  static std::expected<std::shared_ptr<Database>, core::Error>
  connect(const std::string &ConnString) {
    try {
      Log()->debug("Database::connect - Establishing connection");
      auto Db = std::make_shared<Database>(ConnString);
      Log()->info("Database::connect - Successfully connected to database");
      return Db;
    } catch (const std::exception &Err) {
      Log()->error("Database::connect - Connection failed: {}", Err.what());
      return std::unexpected(core::Error{
          .Message = Err.what(), .Kind = core::ErrorKind::Configuration});
    }
  }

  // Runs Body inside one pqxx::work and commits once it returns. Anything
  // Body throws rolls the whole transaction back.
  template <class Fn>
  auto transaction(Fn &&Body)
      -> std::expected<std::invoke_result_t<Fn, pqxx::work &>, core::Error> {
    try {
      pqxx::work Tx(Cx);
      auto Result = std::forward<Fn>(Body)(Tx);
      Tx.commit();
      return Result;
    } catch (const std::exception &Err) {
      Log()->error("Database::transaction - Rolled back: {}", Err.what());
      return std::unexpected(core::Error{Err.what()});
    }
  }

  // Inserts within a caller's transaction. Throws on failure.
  template <core::DbEntity T> static T insert(pqxx::work &Tx, const T &Entity) {
    auto Params = core::DbTraits<T>::toParams(Entity);
    auto Query = std::format(
        "INSERT INTO {} ({}) VALUES ({}) RETURNING *",
        core::DbTraits<T>::TableName, core::DbTraits<T>::Columns,
        placeholders(std::tuple_size_v<decltype(Params)>));

    Log()->trace("Database::insert<{}> - Query: {}",
                 core::DbTraits<T>::TableName, Query);

    pqxx::result Res;
    std::apply(
        [&](auto &&...Args) {
          Res = Tx.exec(pqxx::zview{Query}, pqxx::params{Args...});
        },
        Params);
    return core::DbTraits<T>::fromRow(Res[0]);
  }

  // NotFound when no row has this id.
  template <core::DbEntity T>
  std::expected<T, core::Error> get(std::string_view Id) {
    try {
      pqxx::work Tx(Cx);
      auto Query = std::format("SELECT * FROM {} WHERE id::text = $1",
                               core::DbTraits<T>::TableName);
      auto Result = Tx.exec(pqxx::zview{Query}, pqxx::params{Id});

      if (Result.empty()) {
        Log()->debug("Database::get<{}> - Entity not found: {}",
                     core::DbTraits<T>::TableName, Id);
        return std::unexpected(core::Error{
            .Message = "Not found", .Kind = core::ErrorKind::NotFound});
      }
      return core::DbTraits<T>::fromRow(Result[0]);
    } catch (const std::exception &Err) {
      Log()->error("Database::get<{}> - Failed: {}",
                   core::DbTraits<T>::TableName, Err.what());
      return std::unexpected(core::Error{Err.what()});
    }
  }

  // Newest first, at most Limit rows.
  template <core::DbEntity T>
  std::expected<std::vector<T>, core::Error> getRecent(int Limit) {
    try {
      pqxx::work Tx(Cx);
      auto Query =
          std::format("SELECT * FROM {} ORDER BY created_at DESC LIMIT $1",
                      core::DbTraits<T>::TableName);
      auto Res = Tx.exec(pqxx::zview{Query}, pqxx::params{Limit});

      std::vector<T> Results;
      Results.reserve(Res.size());
      for (const auto &Row : Res) {
        Results.push_back(core::DbTraits<T>::fromRow(Row));
      }
      Log()->trace("Database::getRecent<{}> - Retrieved {} rows",
                   core::DbTraits<T>::TableName, Results.size());
      return Results;
    } catch (const std::exception &Err) {
      Log()->error("Database::getRecent<{}> - Failed: {}",
                   core::DbTraits<T>::TableName, Err.what());
      return std::unexpected(core::Error{Err.what()});
    }
  }

  // Column is interpolated into the query. Callers pass column names, never
  // user input. Both sides compare as text so a malformed id matches nothing.
  template <core::DbEntity T>
  std::expected<std::vector<T>, core::Error>
  getWhere(std::string_view Column, std::string_view Value) {
    try {
      pqxx::work Tx(Cx);
      auto Query =
          std::format("SELECT * FROM {} WHERE {}::text = $1 ORDER BY created_at",
                      core::DbTraits<T>::TableName, Column);
      auto Res = Tx.exec(pqxx::zview{Query}, pqxx::params{Value});

      std::vector<T> Results;
      for (const auto &Row : Res) {
        Results.push_back(core::DbTraits<T>::fromRow(Row));
      }
      return Results;
    } catch (const std::exception &Err) {
      Log()->error("Database::getWhere<{}> - Failed: {}",
                   core::DbTraits<T>::TableName, Err.what());
      return std::unexpected(core::Error{Err.what()});
    }
  }
};

} // namespace repolens::db
