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
/*!
 * \brief Object store backed by S3 (or a S3 compatible store) using the AWS SDK for C++
 */
#ifndef BAMRELAY_S3OBJECTSTORE_H
#define BAMRELAY_S3OBJECTSTORE_H

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <aws/core/Aws.h>
#include <aws/s3/S3Client.h>

#include "ObjectStore.h"
#include "ChunkPipe.h"

namespace bamrelay {

    /*!
     * Initializes the AWS SDK for the lifetime of the object. Exactly one instance must exist
     * while S3 clients are used, usually in main().
     */
    class AwsSdk {
    private:
        Aws::SDKOptions _options;

    public:
        AwsSdk();

        AwsSdk(const AwsSdk &) = delete;

        AwsSdk &operator=(const AwsSdk &) = delete;

        ~AwsSdk();
    };

    typedef struct {
        std::string bucket;
        std::string region;
        std::string endpoint;     //!< endpoint of a S3 compatible store, empty for AWS
        std::string scheme;       //!< "http" or "https"
        bool pathstyle;           //!< use path style addressing instead of virtual hosts
        int connect_timeout;      //!< seconds
        int request_timeout;      //!< seconds
        int chunk_timeout;        //!< seconds to wait for the next chunk of a body
        size_t pipe_capacity;     //!< bytes buffered between the HTTP client and the relay
    } S3StoreOptions;

    /*!
     * \brief Streams one byte range of an object
     *
     * The GetObject request runs in a producer thread and writes the body into a ChunkPipe.
     * The destructor cancels the transfer and joins the thread.
     */
    class S3RangeReader : public RangeReader {
    private:
        std::shared_ptr<Aws::S3::S3Client> _client;
        std::string _bucket;
        std::string _key;
        uint64_t _start;
        uint64_t _end;
        std::chrono::milliseconds _timeout;
        ChunkPipe _pipe;
        std::atomic<bool> _cancelled;
        std::thread _producer;

        void produce();

    public:
        S3RangeReader(std::shared_ptr<Aws::S3::S3Client> client, std::string bucket, std::string key,
                      uint64_t start, uint64_t end, const S3StoreOptions &options);

        ~S3RangeReader() override;

        Outcome<size_t> next(char *buf, size_t n) override;

        void cancel() override;
    };

    class S3ObjectStore : public ObjectStore {
    private:
        S3StoreOptions _options;
        std::shared_ptr<Aws::S3::S3Client> _client;

    public:
        /*!
         * Creates the S3 client. The credentials are taken from the default provider chain
         * (environment, profile, instance metadata).
         *
         * \throws Error if no bucket is given
         */
        explicit S3ObjectStore(S3StoreOptions options);

        Outcome<ObjectInfo> headObject(const std::string &key) override;

        Outcome<std::unique_ptr<RangeReader>> getObjectRange(const std::string &key, uint64_t start, uint64_t end) override;
    };

}

#endif //BAMRELAY_S3OBJECTSTORE_H
