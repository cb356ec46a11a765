// main.cpp
#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <sstream>
#include <memory> // For std::make_shared

// Crow includes
#include <crow.h>

// Our project includes
#include "blob_transport.hpp"
#include "chunk_config.hpp"
#include "drive_errors.hpp"
#include "drive_log.hpp"
#include "inventory_backend.hpp"
#include "inventory_store.hpp"
#include "source_resolver.hpp"
#include "transfer_engine.hpp"

namespace fs = std::filesystem;
using namespace ChunkDrive;

namespace {

crow::json::wvalue fileJson(const Metadata::FileMetadata& file) {
    crow::json::wvalue body;
    body["owner"] = file.owner;
    body["name"] = file.name;
    body["size"] = file.total_size;
    body["created_at"] = file.created_at;

    crow::json::wvalue::list parts;
    for (const auto& part : file.parts) {
        crow::json::wvalue item;
        item["ordinal"] = part.ordinal;
        item["size"] = part.size;
        item["hash"] = part.hash;
        parts.push_back(std::move(item));
    }
    body["parts"] = std::move(parts);
    return body;
}

crow::json::wvalue namesJson(const std::vector<std::string>& names) {
    crow::json::wvalue::list items;
    for (const auto& name : names) {
        items.push_back(crow::json::wvalue(name));
    }
    return crow::json::wvalue(std::move(items));
}

// Maps the engine's error taxonomy onto HTTP status codes.
crow::response errorResponse(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const FileNotFound& e) {
        return crow::response(404, e.what());
    } catch (const EmptyInput& e) {
        return crow::response(400, e.what());
    } catch (const InvalidName& e) {
        return crow::response(400, e.what());
    } catch (const DuplicateName& e) {
        return crow::response(409, e.what());
    } catch (const CorruptPart& e) {
        return crow::response(502, e.what());
    } catch (const TransportError& e) {
        return crow::response(503, e.what());
    } catch (const std::exception& e) {
        return crow::response(500, std::string("Internal Server Error: ") + e.what());
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Config::DriveConfig config;
    try {
        if (argc > 1) {
            config = Config::DriveConfig::load(argv[1]);
        }
        Logging::setLogFile(config.log_file);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }

    std::shared_ptr<TransferEngine> engine;
    try {
        auto transport = std::make_shared<Transport::DirectoryBlobTransport>(config.getChunksDirPath(),
                                                                              config.max_part_size);
        auto backend = std::make_shared<Inventory::JsonDirectoryBackend>(config.getMetadataDirPath());
        auto inventory = std::make_shared<Inventory::InventoryStore>(backend);
        auto resolver = std::make_shared<Sources::LocalSourceResolver>(config.getUploadDirPath());
        engine = std::make_shared<TransferEngine>(config, transport, inventory, resolver);
    } catch (const std::exception& e) {
        Logging::error("STARTUP", "", e.what());
        return 1;
    }

    crow::SimpleApp app;

    // --- POST /users/<owner>/files/<name>: Upload the request body as a file ---
    CROW_ROUTE(app, "/users/<string>/files/<string>").methods("POST"_method)
    ([engine](const crow::request& req, std::string owner, std::string name) {
        try {
            std::istringstream source(req.body);
            Metadata::FileMetadata file = engine->upload(owner, name, source);
            return crow::response(201, fileJson(file)); // 201 Created
        } catch (const std::exception&) {
            return errorResponse(std::current_exception());
        }
    });

    // --- POST /users/<owner>/sources/<link>: Upload a file from the upload directory ---
    CROW_ROUTE(app, "/users/<string>/sources/<string>").methods("POST"_method)
    ([engine](const crow::request& req, std::string owner, std::string link) {
        try {
            std::string name = req.url_params.get("name") ? req.url_params.get("name") : "";
            Metadata::FileMetadata file = engine->uploadFromSource(owner, link, name);
            return crow::response(201, fileJson(file));
        } catch (const std::exception&) {
            return errorResponse(std::current_exception());
        }
    });

    // --- GET /users/<owner>/files: List an owner's files ---
    CROW_ROUTE(app, "/users/<string>/files").methods("GET"_method)
    ([engine](std::string owner) {
        crow::json::wvalue::list items;
        for (const auto& summary : engine->list(owner)) {
            crow::json::wvalue item;
            item["name"] = summary.name;
            item["size"] = summary.size;
            item["parts"] = summary.parts;
            item["created_at"] = summary.created_at;
            items.push_back(std::move(item));
        }
        return crow::response(200, crow::json::wvalue(std::move(items)));
    });

    // --- GET /users/<owner>/files/<name>: Reassemble and return a file ---
    CROW_ROUTE(app, "/users/<string>/files/<string>").methods("GET"_method)
    ([engine](std::string owner, std::string name) {
        try {
            std::vector<char> data = engine->download(owner, name);
            crow::response res(200);
            res.set_header("Content-Type", "application/octet-stream");
            res.set_header("Content-Disposition", "attachment; filename=\"" + TransferEngine::localFileName(name) + "\"");
            res.write(std::string(data.begin(), data.end()));
            return res;
        } catch (const std::exception&) {
            return errorResponse(std::current_exception());
        }
    });

    // --- POST /users/<owner>/downloads: Write every file into download/<owner>/ ---
    CROW_ROUTE(app, "/users/<string>/downloads").methods("POST"_method)
    ([engine, config](std::string owner) {
        try {
            fs::path target = config.getDownloadDirPath() / TransferEngine::localFileName(owner);
            BatchResult result = engine->downloadAll(owner, target);
            crow::json::wvalue body;
            body["succeeded"] = namesJson(result.succeeded);
            body["failed"] = namesJson(result.failed);
            return crow::response(200, std::move(body));
        } catch (const std::exception&) {
            return errorResponse(std::current_exception());
        }
    });

    // --- DELETE /users/<owner>/files/<name>: Remove one file ---
    CROW_ROUTE(app, "/users/<string>/files/<string>").methods("DELETE"_method)
    ([engine](std::string owner, std::string name) {
        try {
            crow::json::wvalue body;
            body["removed"] = engine->remove(owner, name);
            return crow::response(200, std::move(body));
        } catch (const std::exception&) {
            return errorResponse(std::current_exception());
        }
    });

    // --- DELETE /users/<owner>/files: Remove every file of an owner ---
    CROW_ROUTE(app, "/users/<string>/files").methods("DELETE"_method)
    ([engine](std::string owner) {
        try {
            crow::json::wvalue body;
            body["removed"] = engine->removeAll(owner);
            return crow::response(200, std::move(body));
        } catch (const std::exception&) {
            return errorResponse(std::current_exception());
        }
    });

    // --- POST /maintenance/sweep: Discard orphaned blobs ---
    CROW_ROUTE(app, "/maintenance/sweep").methods("POST"_method)
    ([engine]() {
        try {
            crow::json::wvalue body;
            body["reclaimed"] = engine->sweep();
            return crow::response(200, std::move(body));
        } catch (const std::exception&) {
            return errorResponse(std::current_exception());
        }
    });

    Logging::info("STARTUP", "", "Starting ChunkDrive service on http://localhost:" + std::to_string(config.listen_port));
    app.port(config.listen_port).multithreaded().run();

    return 0;
}
