#include <storage/hub_uploader.hpp>
#include <lib/test/ScriptedTransport.h>

#include <arrow/status.h>
#include <folly/FileUtil.h>
#include <folly/String.h>
#include <folly/portability/GMock.h>
#include <folly/portability/GTest.h>
#include <folly/ssl/OpenSSLHash.h>
#include <folly/testing/TestUtil.h>
#include <proxygen/lib/utils/Base64.h>

#include <array>

using namespace testing;
using folly::dynamic;

class HubUploaderTest : public Test {
 protected:
  void SetUp() override {
    local = (dir.path() / "chunk.parquet").string();
    ASSERT_TRUE(folly::writeFile(std::string("PAR1 payload PAR1"),
                                 local.c_str()));
    target.endpoint = "https://hub.test";
    target.repo_id = "gisfun/spatial-datasets";
    target.token = "hf_secret";
  }

  arrow::Status Upload(ScriptedTransport::Responder responder) {
    transport = std::make_unique<ScriptedTransport>(&evb, std::move(responder));
    HubUploader uploader(transport.get(), &evb, target);
    return uploader.Upload(local, "chunks/chunk.parquet");
  }

  const HttpRequest& Request(size_t i) { return transport->requests().at(i); }

  folly::test::TemporaryDirectory dir{"geoharvest"};
  std::string local;
  HubTarget target;
  folly::EventBase evb;
  std::unique_ptr<ScriptedTransport> transport;
};

static std::vector<dynamic> NdJson(const std::string& body) {
  std::vector<folly::StringPiece> lines;
  folly::split('\n', body, lines, /*ignoreEmpty=*/true);
  std::vector<dynamic> out;
  for (auto line : lines)
    out.push_back(folly::parseJson(line));
  return out;
}

static folly::Try<HttpResponse> Preupload(const char* mode) {
  return replyJson(dynamic::object("files", dynamic::array(dynamic::object
    ("path", "chunks/chunk.parquet")("uploadMode", mode)
    ("shouldIgnore", false))));
}

TEST_F(HubUploaderTest, RegularUpload) {
  auto st = Upload([](const HttpRequest& req) {
    if (req.url.find("/preupload/") != std::string::npos)
      return Preupload("regular");
    return replyJson(dynamic::object("commitUrl", "https://hub.test/c/1"));
  });
  ASSERT_TRUE(st.ok()) << st.ToString();
  ASSERT_EQ(transport->requests().size(), 2);

  const HttpRequest& pre = Request(0);
  EXPECT_EQ(pre.method, "POST");
  EXPECT_EQ(pre.url, "https://hub.test/api/datasets/gisfun/spatial-datasets"
                     "/preupload/main");
  EXPECT_EQ(headerValue(pre, "Authorization"), "Bearer hf_secret");
  dynamic files = folly::parseJson(pre.body)["files"];
  ASSERT_EQ(files.size(), 1);
  EXPECT_EQ(files[0]["path"], "chunks/chunk.parquet");
  EXPECT_EQ(files[0]["size"], 17);
  EXPECT_EQ(files[0]["sample"],
            proxygen::Base64::encode(folly::ByteRange(
                folly::StringPiece("PAR1 payload PAR1"))));

  const HttpRequest& commit = Request(1);
  EXPECT_EQ(commit.url, "https://hub.test/api/datasets/gisfun/spatial-datasets"
                        "/commit/main");
  EXPECT_EQ(headerValue(commit, "Content-Type"), "application/x-ndjson");
  auto lines = NdJson(commit.body);
  ASSERT_EQ(lines.size(), 2);
  EXPECT_EQ(lines[0]["key"], "header");
  EXPECT_EQ(lines[0]["value"]["summary"], "Upload chunks/chunk.parquet");
  EXPECT_EQ(lines[1]["key"], "file");
  EXPECT_EQ(lines[1]["value"]["path"], "chunks/chunk.parquet");
  EXPECT_EQ(lines[1]["value"]["encoding"], "base64");
}

TEST_F(HubUploaderTest, LfsUpload) {
  auto st = Upload([](const HttpRequest& req) {
    if (req.url.find("/preupload/") != std::string::npos)
      return Preupload("lfs");
    if (req.url.find("/objects/batch") != std::string::npos) {
      dynamic body = folly::parseJson(req.body);
      return replyJson(dynamic::object("objects", dynamic::array(dynamic::object
        ("oid", body["objects"][0]["oid"])
        ("size", body["objects"][0]["size"])
        ("actions", dynamic::object
          ("upload", dynamic::object
            ("href", "https://storage.test/put/1")
            ("header", dynamic::object("X-Amz-Signature", "sig")))
          ("verify", dynamic::object
            ("href", "https://hub.test/verify")
            ("header", dynamic::object("Authorization", "Basic xyz")))))));
    }
    if (req.method == "PUT" || req.url == "https://hub.test/verify")
      return reply(200);
    return replyJson(dynamic::object("commitUrl", "https://hub.test/c/2"));
  });
  ASSERT_TRUE(st.ok()) << st.ToString();
  ASSERT_EQ(transport->requests().size(), 5);

  const HttpRequest& batch = Request(1);
  EXPECT_EQ(batch.url, "https://hub.test/datasets/gisfun/spatial-datasets.git"
                       "/info/lfs/objects/batch");
  EXPECT_EQ(headerValue(batch, "Accept"), "application/vnd.git-lfs+json");
  dynamic object = folly::parseJson(batch.body)["objects"][0];
  std::array<uint8_t, 32> digest;
  folly::ssl::OpenSSLHash::sha256(
      folly::range(digest),
      folly::ByteRange(folly::StringPiece("PAR1 payload PAR1")));
  EXPECT_EQ(object["oid"], folly::hexlify(folly::range(digest)));
  EXPECT_EQ(object["size"], 17);

  const HttpRequest& put = Request(2);
  EXPECT_EQ(put.method, "PUT");
  EXPECT_EQ(put.url, "https://storage.test/put/1");
  EXPECT_EQ(put.body, "PAR1 payload PAR1");
  EXPECT_EQ(headerValue(put, "X-Amz-Signature"), "sig");
  /* the storage URL is presigned */
  EXPECT_EQ(headerValue(put, "Authorization"), "");

  const HttpRequest& verify = Request(3);
  EXPECT_EQ(verify.url, "https://hub.test/verify");
  EXPECT_EQ(folly::parseJson(verify.body)["oid"], object["oid"]);

  auto lines = NdJson(Request(4).body);
  ASSERT_EQ(lines.size(), 2);
  EXPECT_EQ(lines[1]["key"], "lfsFile");
  EXPECT_EQ(lines[1]["value"]["oid"], object["oid"]);
  EXPECT_EQ(lines[1]["value"]["algo"], "sha256");
  EXPECT_EQ(lines[1]["value"]["size"], 17);
}

TEST_F(HubUploaderTest, LfsObjectAlreadyStored) {
  auto st = Upload([](const HttpRequest& req) {
    if (req.url.find("/preupload/") != std::string::npos)
      return Preupload("lfs");
    if (req.url.find("/objects/batch") != std::string::npos)
      return replyJson(dynamic::object("objects", dynamic::array(
          dynamic::object("oid", "x")("size", 17))));
    return replyJson(dynamic::object());
  });
  ASSERT_TRUE(st.ok()) << st.ToString();
  EXPECT_EQ(transport->requests().size(), 3);
}

TEST_F(HubUploaderTest, MultipartIsRejected) {
  auto st = Upload([](const HttpRequest& req) {
    if (req.url.find("/preupload/") != std::string::npos)
      return Preupload("lfs");
    return replyJson(dynamic::object("objects", dynamic::array(dynamic::object
      ("oid", "x")
      ("actions", dynamic::object("upload", dynamic::object
        ("href", "https://storage.test/multi")
        ("header", dynamic::object("chunk_size", "5242880")("00001", "u1"))))))));
  });
  EXPECT_TRUE(st.IsNotImplemented());
  EXPECT_EQ(transport->requests().size(), 2);
}

TEST_F(HubUploaderTest, MissingTokenMakesNoRequest) {
  target.token.clear();
  auto st = Upload([](const HttpRequest&) { return reply(200); });
  EXPECT_TRUE(st.IsInvalid());
  EXPECT_TRUE(transport->requests().empty());
}

TEST_F(HubUploaderTest, HttpErrorCarriesStatusAndBody) {
  auto st = Upload([](const HttpRequest&) {
    return reply(401, "{\"error\":\"Invalid credentials\"}");
  });
  ASSERT_TRUE(st.IsIOError());
  EXPECT_THAT(st.message(), HasSubstr("HTTP 401"));
  EXPECT_THAT(st.message(), HasSubstr("Invalid credentials"));
  EXPECT_EQ(transport->requests().size(), 1);
}

TEST_F(HubUploaderTest, TransportFailure) {
  auto st = Upload([](const HttpRequest&) {
    return transportFailure("connection refused");
  });
  ASSERT_TRUE(st.IsIOError());
  EXPECT_THAT(st.message(), HasSubstr("connection refused"));
}

TEST_F(HubUploaderTest, MissingLocalFile) {
  local = (dir.path() / "missing.parquet").string();
  auto st = Upload([](const HttpRequest&) { return reply(200); });
  EXPECT_TRUE(st.IsIOError());
  EXPECT_TRUE(transport->requests().empty());
}
