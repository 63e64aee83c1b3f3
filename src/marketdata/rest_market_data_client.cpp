// src/marketdata/rest_market_data_client.cpp

#include "optwatch/marketdata/rest_market_data_client.hpp"
#include <curl/curl.h>
#include <algorithm>
#include "optwatch/core/logger.hpp"
#include "optwatch/marketdata/field_coercion.hpp"

namespace optwatch {

RestMarketDataClient::RestMarketDataClient(RestClientOptions options)
    : options_(std::move(options)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    while (!options_.base_url.empty() && options_.base_url.back() == '/') {
        options_.base_url.pop_back();
    }
}

RestMarketDataClient::~RestMarketDataClient() {
    curl_global_cleanup();
}

size_t RestMarketDataClient::write_callback(void* contents, size_t size, size_t nmemb,
                                            std::string* out) {
    out->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string RestMarketDataClient::escape(const std::string& value) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return value;
    }
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    std::string result = escaped ? std::string(escaped) : value;
    curl_free(escaped);
    curl_easy_cleanup(curl);
    return result;
}

Result<std::string> RestMarketDataClient::perform_request(const std::string& method,
                                                          const std::string& endpoint,
                                                          const std::string& payload) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error<std::string>(ErrorCode::CONNECTION_ERROR, "Failed to initialize CURL",
                                       "RestMarketDataClient");
    }

    std::string response;
    const std::string url = options_.base_url + endpoint;
    TRACE(method << " " << url);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (!options_.api_key.empty()) {
        headers = curl_slist_append(headers, ("X-API-KEY: " + options_.api_key).c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, RestMarketDataClient::write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    }

    CURLcode res = curl_easy_perform(curl);
    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        const ErrorCode code = res == CURLE_OPERATION_TIMEDOUT ? ErrorCode::TIMEOUT_ERROR
                                                               : ErrorCode::CONNECTION_ERROR;
        return make_error<std::string>(code,
                                       method + " " + endpoint + " failed: " +
                                           curl_easy_strerror(res),
                                       "RestMarketDataClient");
    }

    if (http_status >= 400) {
        return make_error<std::string>(ErrorCode::API_ERROR,
                                       method + " " + endpoint + " returned HTTP " +
                                           std::to_string(http_status),
                                       "RestMarketDataClient");
    }

    return Result<std::string>(std::move(response));
}

TableResult RestMarketDataClient::get_expiration_dates(const std::string& underlying_code) {
    auto body = perform_request("GET", "/expiration_dates?code=" + escape(underlying_code), "");
    if (body.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(body.error()->code(),
                                                         body.error()->what(),
                                                         "RestMarketDataClient");
    }
    return parse_reply(body.value());
}

TableResult RestMarketDataClient::get_option_chain(const std::string& underlying_code,
                                                   const std::string& start_date,
                                                   const std::string& end_date,
                                                   ChainFilter filter) {
    const std::string endpoint = "/option_chain?code=" + escape(underlying_code) +
                                 "&start=" + escape(start_date) + "&end=" + escape(end_date) +
                                 "&option_type=" + chain_filter_to_string(filter);
    auto body = perform_request("GET", endpoint, "");
    if (body.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(body.error()->code(),
                                                         body.error()->what(),
                                                         "RestMarketDataClient");
    }
    return parse_reply(body.value());
}

TableResult RestMarketDataClient::get_market_snapshot(const std::vector<std::string>& codes) {
    nlohmann::json payload;
    payload["codes"] = codes;

    auto body = perform_request("POST", "/market_snapshot", payload.dump());
    if (body.is_error()) {
        return make_error<std::shared_ptr<arrow::Table>>(body.error()->code(),
                                                         body.error()->what(),
                                                         "RestMarketDataClient");
    }
    return parse_reply(body.value());
}

TableResult RestMarketDataClient::parse_reply(const std::string& body) {
    nlohmann::json reply;
    try {
        reply = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::JSON_PARSE_ERROR, std::string("Malformed gateway reply: ") + e.what(),
            "RestMarketDataClient");
    }

    if (!reply.is_object()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::INVALID_DATA, "Gateway reply is not an object", "RestMarketDataClient");
    }

    const Count ret_code =
        reply.contains("ret_code") ? FieldCoercion::json_count(reply["ret_code"], -1) : 0;
    if (ret_code != 0) {
        const std::string message =
            reply.contains("ret_msg") ? FieldCoercion::json_string(reply["ret_msg"]) : "";
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::API_ERROR,
            "Gateway returned ret_code " + std::to_string(ret_code) + ": " + message,
            "RestMarketDataClient");
    }

    if (!reply.contains("data") || reply["data"].is_null()) {
        return rows_to_table(nlohmann::json::array());
    }
    return rows_to_table(reply["data"]);
}

TableResult RestMarketDataClient::rows_to_table(const nlohmann::json& rows) {
    if (!rows.is_array()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::INVALID_DATA, "Gateway data is not an array", "RestMarketDataClient");
    }

    std::vector<std::string> names;
    for (const auto& row : rows) {
        if (!row.is_object()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::INVALID_DATA, "Gateway row is not an object", "RestMarketDataClient");
        }
        for (const auto& item : row.items()) {
            if (std::find(names.begin(), names.end(), item.key()) == names.end()) {
                names.push_back(item.key());
            }
        }
    }

    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;

    for (const auto& name : names) {
        bool numeric = true;
        for (const auto& row : rows) {
            auto it = row.find(name);
            if (it != row.end() && !it->is_null() && !it->is_number()) {
                numeric = false;
                break;
            }
        }

        std::shared_ptr<arrow::Array> array;
        arrow::Status status;
        if (numeric) {
            arrow::DoubleBuilder builder;
            for (const auto& row : rows) {
                auto it = row.find(name);
                status = (it == row.end() || it->is_null()) ? builder.AppendNull()
                                                            : builder.Append(it->get<double>());
                if (!status.ok()) {
                    break;
                }
            }
            if (status.ok()) {
                status = builder.Finish(&array);
            }
            fields.push_back(arrow::field(name, arrow::float64()));
        } else {
            arrow::StringBuilder builder;
            for (const auto& row : rows) {
                auto it = row.find(name);
                status = (it == row.end() || it->is_null())
                             ? builder.AppendNull()
                             : builder.Append(FieldCoercion::json_string(*it));
                if (!status.ok()) {
                    break;
                }
            }
            if (status.ok()) {
                status = builder.Finish(&array);
            }
            fields.push_back(arrow::field(name, arrow::utf8()));
        }

        if (!status.ok()) {
            return make_error<std::shared_ptr<arrow::Table>>(
                ErrorCode::CONVERSION_ERROR,
                "Failed to build column " + name + ": " + status.ToString(),
                "RestMarketDataClient");
        }
        arrays.push_back(array);
    }

    auto table = arrow::Table::Make(arrow::schema(fields), arrays,
                                    static_cast<int64_t>(rows.size()));
    return TableResult(std::move(table));
}

}  // namespace optwatch
