#include "gcli/remote/glacier_service.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <deque>
#include <sstream>
#include <string>

using namespace gcli;
using namespace gcli::remote;

namespace {

/// Replays queued responses and keeps every request it was given.
class ScriptedTransport : public HttpTransport {
public:
    struct Shared {
        std::deque<Result<HttpResponse>> responses;
        std::vector<HttpRequest> requests;
    };

    explicit ScriptedTransport(Shared& shared) : shared_(shared) {}

    Result<HttpResponse> send(const HttpRequest& request) override {
        shared_.requests.push_back(request);
        if (shared_.responses.empty()) {
            return Err<HttpResponse>(ErrorKind::Remote, "no scripted response");
        }
        auto next = std::move(shared_.responses.front());
        shared_.responses.pop_front();
        return next;
    }

private:
    Shared& shared_;
};

HttpResponse reply(int status, const std::string& body = "", HttpHeaders headers = {}) {
    HttpResponse response;
    response.status_code = status;
    response.reason_phrase = status < 300 ? "OK" : "Error";
    response.headers = std::move(headers);
    response.body.assign(body.begin(), body.end());
    return response;
}

HttpHeaders header(const std::string& name, const std::string& value) {
    HttpHeaders headers;
    headers.set(name, value);
    return headers;
}

class GlacierServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        GlacierService::Options options;
        options.region = "eu-west-1";
        options.credentials = Credentials{"AKIDEXAMPLE", "secret", ""};
        service = std::make_unique<GlacierService>(options, std::make_unique<ScriptedTransport>(transport),
                                                   [] { return Timestamp{1337905493}; });
    }

    void queue(HttpResponse response) { transport.responses.push_back(Ok(std::move(response))); }

    ScriptedTransport::Shared transport;
    std::unique_ptr<GlacierService> service;
};

} // namespace

TEST_F(GlacierServiceTest, ListVaultsFollowsMarker) {
    queue(reply(200, R"({"VaultList":[{"VaultName":"a","CreationDate":"2013-05-07T22:51:52Z"}],"Marker":"next-page"})"));
    queue(reply(200, R"({"VaultList":[{"VaultName":"b","CreationDate":"2013-05-07T22:51:52Z"}],"Marker":null})"));

    auto vaults = service->list_vaults();
    ASSERT_TRUE(vaults.is_ok()) << vaults.error().message;
    ASSERT_EQ(vaults.value().size(), 2u);
    EXPECT_EQ(vaults.value()[0].name, "a");
    EXPECT_EQ(vaults.value()[1].name, "b");

    ASSERT_EQ(transport.requests.size(), 2u);
    EXPECT_EQ(transport.requests[0].target(), "/-/vaults");
    EXPECT_EQ(transport.requests[1].target(), "/-/vaults?marker=next-page");
    for (const auto& request : transport.requests) {
        EXPECT_EQ(request.headers.get("Host"), "glacier.eu-west-1.amazonaws.com");
        EXPECT_EQ(request.headers.get("x-amz-glacier-version"), "2012-06-01");
        EXPECT_EQ(request.headers.get("Authorization").rfind("AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/20120525/", 0), 0u);
    }
}

TEST_F(GlacierServiceTest, NotFoundAndServiceErrors) {
    queue(reply(404, R"({"code":"ResourceNotFoundException","message":"Vault not found for ARN"})"));
    auto missing = service->list_jobs("ghost");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);
    EXPECT_NE(missing.error().message.find("Vault not found for ARN"), std::string::npos);

    queue(reply(500, "internal"));
    auto broken = service->create_vault("photos");
    ASSERT_TRUE(broken.is_error());
    EXPECT_EQ(broken.error().kind, ErrorKind::Remote);
    EXPECT_NE(broken.error().message.find("(HTTP 500): internal"), std::string::npos);

    auto unreachable = service->delete_vault("photos");
    ASSERT_TRUE(unreachable.is_error());
    EXPECT_EQ(unreachable.error().kind, ErrorKind::Remote);
}

TEST_F(GlacierServiceTest, InitiatesJobs) {
    queue(reply(202, "", header("x-amz-job-id", "INVJOB")));
    auto inventory = service->initiate_inventory_retrieval("photos");
    ASSERT_TRUE(inventory.is_ok()) << inventory.error().message;
    EXPECT_EQ(inventory.value(), "INVJOB");

    const auto& request = transport.requests.back();
    EXPECT_EQ(request.method, HttpMethod::POST);
    EXPECT_EQ(request.path, "/-/vaults/photos/jobs");
    const auto body = nlohmann::json::parse(request.body_as_string());
    EXPECT_EQ(body["Type"], "inventory-retrieval");
    EXPECT_EQ(body["Format"], "JSON");

    queue(reply(202, "", header("x-amz-job-id", "ARCJOB")));
    auto retrieval = service->initiate_archive_retrieval("photos", "ARCHIVE-1");
    ASSERT_TRUE(retrieval.is_ok());
    const auto retrieval_body = nlohmann::json::parse(transport.requests.back().body_as_string());
    EXPECT_EQ(retrieval_body["Type"], "archive-retrieval");
    EXPECT_EQ(retrieval_body["ArchiveId"], "ARCHIVE-1");

    queue(reply(202));
    auto no_id = service->initiate_inventory_retrieval("photos");
    ASSERT_TRUE(no_id.is_error());
    EXPECT_EQ(no_id.error().kind, ErrorKind::DataError);
}

TEST_F(GlacierServiceTest, RangedJobOutput) {
    queue(reply(206, "0123"));
    auto chunk = service->get_job_output("photos", "JOB", transfer::ChunkRange{4, 8});
    ASSERT_TRUE(chunk.is_ok()) << chunk.error().message;
    EXPECT_EQ(transport.requests.back().headers.get("Range"), "bytes=4-7");
    EXPECT_EQ(transport.requests.back().path, "/-/vaults/photos/jobs/JOB/output");

    queue(reply(206, "01"));
    auto short_read = service->get_job_output("photos", "JOB", transfer::ChunkRange{4, 8});
    ASSERT_TRUE(short_read.is_error());
    EXPECT_EQ(short_read.error().kind, ErrorKind::DataError);

    queue(reply(200, "whole"));
    auto whole = service->get_job_output("photos", "JOB", std::nullopt);
    ASSERT_TRUE(whole.is_ok());
    EXPECT_FALSE(transport.requests.back().headers.has("Range"));
}

TEST_F(GlacierServiceTest, MultipartUploadRequests) {
    queue(reply(201, "", header("x-amz-multipart-upload-id", "UPLOAD")));
    auto upload_id = service->initiate_multipart_upload("photos", "big.tar", 1048576);
    ASSERT_TRUE(upload_id.is_ok());
    EXPECT_EQ(transport.requests.back().headers.get("x-amz-part-size"), "1048576");
    EXPECT_EQ(transport.requests.back().headers.get("x-amz-archive-description"), "big.tar");

    std::istringstream source("abcdefghij");
    auto part = transfer::WindowedReader::create(source, 2, 6);
    ASSERT_TRUE(part.is_ok());
    queue(reply(204));
    ASSERT_TRUE(service->upload_part("photos", "UPLOAD", transfer::ChunkRange{2, 6}, part.value()).is_ok());
    const auto& put = transport.requests.back();
    EXPECT_EQ(put.method, HttpMethod::PUT);
    EXPECT_EQ(put.path, "/-/vaults/photos/multipart-uploads/UPLOAD");
    EXPECT_EQ(put.headers.get("Content-Range"), "bytes 2-5/*");
    EXPECT_EQ(put.body_as_string(), "cdef");
    EXPECT_EQ(put.headers.get("x-amz-content-sha256"), sha256_hex(std::string("cdef")));

    queue(reply(201, "", header("x-amz-archive-id", "ARCHIVE")));
    auto done = service->complete_multipart_upload("photos", "UPLOAD", 10, "hash");
    ASSERT_TRUE(done.is_ok());
    EXPECT_EQ(done.value().archive_id, "ARCHIVE");
    EXPECT_EQ(transport.requests.back().headers.get("x-amz-archive-size"), "10");
    EXPECT_EQ(transport.requests.back().headers.get("x-amz-sha256-tree-hash"), "hash");

    queue(reply(204));
    ASSERT_TRUE(service->abort_multipart_upload("photos", "UPLOAD").is_ok());
    EXPECT_EQ(transport.requests.back().method, HttpMethod::DELETE_METHOD);
}

TEST_F(GlacierServiceTest, DescribeJob) {
    queue(reply(200, R"({"JobId":"J","Action":"InventoryRetrieval","StatusCode":"Succeeded","Completed":true,
                         "CreationDate":"2013-05-07T22:51:52Z","CompletionDate":"2013-05-07T23:51:52Z"})"));
    auto job = service->describe_job("photos", "J");
    ASSERT_TRUE(job.is_ok()) << job.error().message;
    EXPECT_EQ(job.value().action, JobAction::InventoryRetrieval);
    EXPECT_TRUE(job.value().completed);
    EXPECT_EQ(transport.requests.back().path, "/-/vaults/photos/jobs/J");
}
