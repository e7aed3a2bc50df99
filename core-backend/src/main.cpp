#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "api/api_server.hpp"
#include "core/config.hpp"
#include "core/database.hpp"
#include "loaders/perspective_loader.hpp"
#include "loaders/reference_loader.hpp"
#include "perspective/engine.hpp"

void print_usage(const char *prog) {
  std::cout << "用法: " << prog
            << " --config <config.json> [--input <request.json>] [--store-perspectives <perspectives.json>]"
            << std::endl;
}

int main(int argc, char *argv[]) {
  std::string config_path = "config.json";
  std::string input_path;
  std::string store_path;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
      input_path = argv[++i];
    } else if (std::strcmp(argv[i], "--store-perspectives") == 0 && i + 1 < argc) {
      store_path = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
  }

  try {
    Config config = Config::load(config_path);

    std::cout << "========================================" << std::endl;
    std::cout << "    Perspective Service" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "[Main] DB Path: " << (config.db_path.empty() ? "(none)" : config.db_path) << std::endl;
    std::cout << "[Main] Perspectives: "
              << (config.perspectives_table.empty() ? config.perspectives_path : config.perspectives_table)
              << std::endl;

    std::unique_ptr<Database> db;
    std::unique_ptr<loaders::ReferenceLoader> references;
    if (!config.db_path.empty()) {
      db = std::make_unique<Database>(config.db_path);
      db->init_reference_store(config.perspectives_table);
      references = std::make_unique<loaders::DatabaseReferenceLoader>(*db);
    }

    // 写入一份新的 perspective 文档后退出
    if (!store_path.empty()) {
      if (!db || config.perspectives_table.empty())
        throw perspective::ConfigError("--store-perspectives needs db_path and perspectives_table");
      std::ifstream f(store_path);
      if (!f.is_open())
        throw perspective::InputError("无法打开 perspective 文件: " + store_path);
      json document = json::parse(f, nullptr, false);
      if (document.is_discarded())
        throw perspective::InputError("perspective 文件格式错误: " + store_path);
      loaders::DatabasePerspectiveLoader(*db, config.perspectives_table).store(document);
      return 0;
    }

    std::unique_ptr<loaders::PerspectiveLoader> perspectives;
    if (!config.perspectives_table.empty())
      perspectives = std::make_unique<loaders::DatabasePerspectiveLoader>(*db, config.perspectives_table);
    else if (!config.perspectives_path.empty())
      perspectives = std::make_unique<loaders::FilePerspectiveLoader>(config.perspectives_path);

    perspective::PerspectiveEngine engine(perspectives.get(), references.get(), config.system_version_timestamp,
                                          config.insert_batch_rows);

    // 单次模式: 处理一个请求文件后退出
    if (!input_path.empty()) {
      std::ifstream f(input_path);
      if (!f.is_open())
        throw perspective::InputError("无法打开请求文件: " + input_path);
      json request = json::parse(f, nullptr, false);
      if (request.is_discarded())
        throw perspective::InputError("请求文件格式错误: " + input_path);
      std::cout << engine.process(request).dump(2) << std::endl;
      return 0;
    }

    asio::io_context ioc_api;
    ApiServer api_server(ioc_api, engine, static_cast<unsigned short>(config.port));
    ioc_api.run();
  } catch (const perspective::ConfigError &e) {
    std::cerr << "[Main] configuration error: " << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "[Main] " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
