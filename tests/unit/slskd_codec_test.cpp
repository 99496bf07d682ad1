#include "internal/provider/slskd_codec.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

namespace slskd = trackmatch::provider::slskd;

constexpr const char* kCompletedSearch = R"({
  "id": "6d1c7a9e-0000-4000-8000-000000000001",
  "searchText": "Artist Song",
  "state": "Completed, TimedOut",
  "isComplete": false,
  "fileCount": 3,
  "responseCount": 2,
  "lockedFileCount": 0,
  "startedAt": "2024-01-01T00:00:00Z",
  "responses": [
    {
      "username": "peer1",
      "hasFreeUploadSlot": true,
      "uploadSpeed": 4000000,
      "queueLength": 0,
      "token": 17,
      "files": [
        {"filename": "@@music\\Artist\\Artist - Song.FLAC", "size": 31000000, "extension": "", "bitDepth": 16, "sampleRate": 44100, "length": 201},
        {"filename": "@@music\\Artist\\cover.jpg", "size": 90000}
      ]
    },
    {
      "username": "peer2",
      "hasFreeUploadSlot": false,
      "uploadSpeed": 150000,
      "queueLength": 12,
      "files": [
        {"filename": "Song.mp3", "size": 8000000, "bitRate": 320, "length": 199}
      ]
    }
  ]
})";

void TestEncodeSearchRequest() {
  const auto json = slskd::EncodeSearchRequest("abc", "Artist Song", std::chrono::milliseconds(15000));

  assert(json.find("\"id\":\"abc\"") != std::string::npos);
  assert(json.find("\"searchText\":\"Artist Song\"") != std::string::npos);
  assert(json.find("\"searchTimeout\":15000") != std::string::npos);
}

void TestCompletedStateIgnoresUnknownFields() {
  const auto state  = slskd::DecodeSearchState(kCompletedSearch);
  const auto status = slskd::ToSearchStatus(state);

  assert(state.search_text() == "Artist Song");
  assert(status.complete);
  assert(status.file_count == 3);
  assert(status.response_count == 2);
}

void TestCompletionFlags() {
  auto status = slskd::ToSearchStatus(slskd::DecodeSearchState(R"({"id":"x","state":"InProgress","fileCount":1})"));
  assert(!status.complete);
  assert(status.state == "InProgress");

  status = slskd::ToSearchStatus(slskd::DecodeSearchState(R"({"id":"x","state":"InProgress","isComplete":true})"));
  assert(status.complete);
}

void TestCandidatesFlattenResponses() {
  const auto candidates = slskd::ToCandidates(slskd::DecodeSearchState(kCompletedSearch));
  assert(candidates.size() == 3);

  const auto& flac = candidates[0];
  assert(flac.username() == "peer1");
  assert(flac.extension() == "flac");
  assert(flac.has_free_slot());
  assert(flac.upload_speed() == 4000000);
  assert(flac.bit_depth() == 16);
  assert(flac.sample_rate() == 44100);
  assert(flac.has_length_secs() && flac.length_secs() == 201);

  const auto& image = candidates[1];
  assert(image.extension() == "jpg");
  assert(!image.has_length_secs());
  assert(image.bit_depth() == 0);

  const auto& mp3 = candidates[2];
  assert(mp3.username() == "peer2");
  assert(!mp3.has_free_slot());
  assert(mp3.queue_length() == 12);
  assert(mp3.bit_rate() == 320);
}

void TestSearchList() {
  const auto searches = slskd::DecodeSearchList(R"([{"id":"a","state":"Completed"},{"id":"b","state":"InProgress"}])");
  assert(searches.size() == 2);
  assert(searches[0].id() == "a");
  assert(searches[1].id() == "b");

  assert(slskd::DecodeSearchList("[]").empty());
}

void TestMalformedJsonRaisesProviderError() {
  bool threw = false;
  try {
    (void)slskd::DecodeSearchState("{not json");
  } catch (const trackmatch::util::ProviderError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEncodeSearchRequest();
  TestCompletedStateIgnoresUnknownFields();
  TestCompletionFlags();
  TestCandidatesFlattenResponses();
  TestSearchList();
  TestMalformedJsonRaisesProviderError();
  std::cout << "trackmatch_unit_slskd_codec: pass\n";
  return 0;
}
