/*
 * Copyright © 2022 Lukas Rosenthaler
 * This file is part of bamrelay
 * bamrelay is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * bamrelay is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 */
#include <optional>
#include <utility>

#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpRequest.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/http/Scheme.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>

#include "fmt/format.h"

#include "Error.h"
#include "Bamrelay.h"
#include "RangeTranslator.h"
#include "S3ObjectStore.h"

static const char file_[] = __FILE__;

static const char ALLOCATION_TAG[] = "bamrelay";

namespace bamrelay {

    AwsSdk::AwsSdk() {
        _options.httpOptions.installSigPipeHandler = true;
        Aws::InitAPI(_options);
        Server::logger()->debug("AWS SDK initialized");
    }

    AwsSdk::~AwsSdk() {
        Aws::ShutdownAPI(_options);
    }
    //=========================================================================

    static bool is_not_found(const Aws::Client::AWSError<Aws::S3::S3Errors> &err) {
        return (err.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND) ||
               (err.GetResponseCode() == Aws::Http::HttpResponseCode::FORBIDDEN) ||
               (err.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_KEY) ||
               (err.GetErrorType() == Aws::S3::S3Errors::RESOURCE_NOT_FOUND);
    }
    //=========================================================================

    S3RangeReader::S3RangeReader(std::shared_ptr<Aws::S3::S3Client> client, std::string bucket, std::string key,
                                 uint64_t start, uint64_t end, const S3StoreOptions &options)
            : _client(std::move(client)),
              _bucket(std::move(bucket)),
              _key(std::move(key)),
              _start(start),
              _end(end),
              _timeout(std::chrono::seconds(options.chunk_timeout)),
              _pipe(options.pipe_capacity),
              _cancelled(false) {
        _producer = std::thread(&S3RangeReader::produce, this);
    }
    //=========================================================================

    S3RangeReader::~S3RangeReader() {
        cancel();
        if (_producer.joinable()) _producer.join();
    }
    //=========================================================================

    void S3RangeReader::produce() {
        Aws::S3::Model::GetObjectRequest request;
        request.SetBucket(_bucket.c_str());
        request.SetKey(_key.c_str());
        request.SetRange(fmt::format("bytes={}-{}", _start, _end).c_str());

        //
        // the body is written directly into the pipe, the SDK never holds more than one buffer
        //
        request.SetResponseStreamFactory([this]() {
            return Aws::New<Aws::IOStream>(ALLOCATION_TAG, &_pipe);
        });
        request.SetHeadersReceivedEventHandler([this](const Aws::Http::HttpRequest *, Aws::Http::HttpResponse *response) {
            int code = static_cast<int>(response->GetResponseCode());
            if ((code < 200) || (code > 299)) {
                _pipe.discard(); // error document, not object data
                return;
            }
            std::string content_range;
            if (response->HasHeader("content-range")) {
                content_range = response->GetHeader("content-range").c_str();
            }
            std::optional<RelayFault> fault = check_upstream_range(code, content_range, ByteRange{_start, _end});
            if (fault.has_value()) {
                _pipe.discard();
                _pipe.fail(fault.value());
                _cancelled = true;
            }
        });
        request.SetContinueRequestHandler([this](const Aws::Http::HttpRequest *) {
            return !_cancelled.load();
        });

        Aws::S3::Model::GetObjectOutcome outcome = _client->GetObject(request);
        if (outcome.IsSuccess() || _cancelled) {
            _pipe.close();
            return;
        }
        const auto &err = outcome.GetError();
        if (is_not_found(err)) {
            _pipe.fail(RelayFault(RelayFault::NOT_FOUND, fmt::format("Object \"{}\" not found", _key)));
        } else {
            _pipe.fail(RelayFault(RelayFault::UPSTREAM_TRANSIENT_FAILURE,
                                  fmt::format("GetObject \"{}\" bytes {}-{} failed: {} ({})", _key, _start, _end,
                                              err.GetMessage().c_str(), static_cast<int>(err.GetResponseCode()))));
        }
    }
    //=========================================================================

    Outcome<size_t> S3RangeReader::next(char *buf, size_t n) {
        return _pipe.read(buf, n, _timeout);
    }
    //=========================================================================

    void S3RangeReader::cancel() {
        _cancelled = true;
        _pipe.cancel();
    }
    //=========================================================================

    S3ObjectStore::S3ObjectStore(S3StoreOptions options) : _options(std::move(options)) {
        if (_options.bucket.empty()) {
            throw Error(file_, __LINE__, "No S3 bucket given");
        }

        Aws::Client::ClientConfiguration config;
        config.region = _options.region.c_str();
        if (!_options.endpoint.empty()) {
            config.endpointOverride = _options.endpoint.c_str();
        }
        config.scheme = Aws::Http::SchemeMapper::FromString(_options.scheme.c_str());
        config.connectTimeoutMs = _options.connect_timeout * 1000;
        config.requestTimeoutMs = _options.request_timeout * 1000;
        config.retryStrategy = std::make_shared<Aws::Client::DefaultRetryStrategy>(0); // no retries

        _client = std::make_shared<Aws::S3::S3Client>(config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
                                                      !_options.pathstyle);
        Server::logger()->info("S3 object store: bucket \"{}\" region \"{}\"{}", _options.bucket, _options.region,
                               _options.endpoint.empty() ? "" : fmt::format(" endpoint \"{}\"", _options.endpoint));
    }
    //=========================================================================

    Outcome<ObjectInfo> S3ObjectStore::headObject(const std::string &key) {
        Aws::S3::Model::HeadObjectRequest request;
        request.SetBucket(_options.bucket.c_str());
        request.SetKey(key.c_str());

        Aws::S3::Model::HeadObjectOutcome outcome = _client->HeadObject(request);
        if (outcome.IsSuccess()) {
            return ObjectInfo{true, static_cast<uint64_t>(outcome.GetResult().GetContentLength())};
        }
        const auto &err = outcome.GetError();
        if (is_not_found(err)) {
            Server::logger()->debug("HeadObject \"{}\": not found ({})", key, static_cast<int>(err.GetResponseCode()));
            return ObjectInfo{false, 0};
        }
        return RelayFault(RelayFault::UPSTREAM_TRANSIENT_FAILURE,
                          fmt::format("HeadObject \"{}\" failed: {} ({})", key, err.GetMessage().c_str(),
                                      static_cast<int>(err.GetResponseCode())));
    }
    //=========================================================================

    Outcome<std::unique_ptr<RangeReader>> S3ObjectStore::getObjectRange(const std::string &key, uint64_t start,
                                                                        uint64_t end) {
        if (start > end) {
            return RelayFault(RelayFault::UNSATISFIABLE_RANGE, fmt::format("Invalid range {}-{}", start, end));
        }
        std::unique_ptr<RangeReader> reader = std::make_unique<S3RangeReader>(_client, _options.bucket, key, start, end,
                                                                              _options);
        return std::move(reader);
    }
    //=========================================================================

}
