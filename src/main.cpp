#include <drogon/drogon.h>
#include <json/json.h>
#include <filesystem>
#include <iostream>
#include <string>
#include <unordered_map>
#include "LogController.hpp"
#include "RequestError.hpp"
#include "RequestParams.hpp"
#include "ServiceConfig.hpp"

namespace {

trantor::Logger::LogLevel toLogLevel(const std::string& level) {
    if (level == "TRACE") return trantor::Logger::kTrace;
    if (level == "DEBUG") return trantor::Logger::kDebug;
    if (level == "WARN") return trantor::Logger::kWarn;
    if (level == "ERROR") return trantor::Logger::kError;
    return trantor::Logger::kInfo;
}

std::unordered_map<std::string, std::string> queryOf(const drogon::HttpRequestPtr& req) {
    std::unordered_map<std::string, std::string> query;
    for (const auto& [key, value] : req->getParameters()) {
        query.emplace(key, value);
    }
    return query;
}

drogon::HttpResponsePtr errorResponse(const LogController& controller, int status, const std::string& message) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(controller.createError(status, message));
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(status));
    return resp;
}

// GET /read?name=...&filter=...&count=...&content-disposition=...
void handleRead(const LogController& controller, const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    LOG_INFO << req->getMethodString() << " " << req->getPath() << "?" << req->getQuery();
    try {
        // All validation happens before any of the body is produced.
        auto params = RequestParams::extract(queryOf(req), Endpoint::Read);
        ReadResponse result = controller.readLines(params);

        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setContentTypeCode(drogon::CT_TEXT_PLAIN);
        if (!result.contentDisposition.empty()) {
            resp->addHeader("Content-Disposition", result.contentDisposition);
        }
        resp->setBody(std::move(result.body));
        callback(resp);
    } catch (const RequestError& e) {
        callback(errorResponse(controller, e.status(), e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR << "Unexpected error serving /read: " << e.what();
        callback(errorResponse(controller, 500, e.what()));
    }
}

// GET /list?name=...&filter=...
void handleList(const LogController& controller, const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    LOG_INFO << req->getMethodString() << " " << req->getPath() << "?" << req->getQuery();
    try {
        auto params = RequestParams::extract(queryOf(req), Endpoint::List);
        Json::Value data = controller.listEntries(params);

        Json::StreamWriterBuilder writer;
        writer["indentation"] = "  ";
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
        resp->setBody(Json::writeString(writer, data));
        callback(resp);
    } catch (const RequestError& e) {
        callback(errorResponse(controller, e.status(), e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR << "Unexpected error serving /list: " << e.what();
        callback(errorResponse(controller, 500, e.what()));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace drogon;

    const std::string configPath = argc > 1 ? argv[1] : "config.json";
    if (argc > 2 || configPath == "-h" || configPath == "--help") {
        std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
        return argc > 2 ? 1 : 0;
    }

    ServiceConfig config;
    try {
        config = loadServiceConfig(configPath);
        validateServiceConfig(config);
    } catch (const std::exception& e) {
        std::cerr << "*** " << e.what() << std::endl;
        return 1;
    }
    trantor::Logger::setLogLevel(toLogLevel(config.logLevel));

    // drogon's own settings (threads, log path) live in the same file
    if (std::filesystem::exists(configPath)) {
        app().loadConfigFile(configPath);
    }

    LogController controller(config);

    app().registerHandler("/read",
        [&controller](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleRead(controller, req, std::move(callback));
        },
        {Get});

    app().registerHandler("/list",
        [&controller](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleList(controller, req, std::move(callback));
        },
        {Get});

    app().addListener(config.address, static_cast<uint16_t>(config.port));

    LOG_INFO << "varlog-srv starting on " << config.address << ":" << config.port
             << ", root \"" << config.root << "\", chunk size " << config.chunkSize;
    app().run();

    return 0;
}
