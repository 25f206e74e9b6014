#include "../include/storysync/storysync.hpp"

#include <cassert>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

namespace {

std::string make_story(const std::string &id, const std::string &title,
                       int entries, const char *genre = nullptr) {
  storysync::json story = {{"id", id}, {"title", title}, {"updatedAt", 1700000000123LL}};
  if (genre != nullptr)
    story["genre"] = genre;
  storysync::json doc = {{"version", 1}, {"story", story},
                         {"entries", storysync::json::array()}};
  for (int i = 0; i < entries; ++i)
    doc["entries"].push_back({{"content", "entry " + std::to_string(i)}});
  return doc.dump();
}

storysync::sync_request request(const std::string &token,
                                storysync::sync_action action) {
  return storysync::sync_request{token, std::move(action)};
}

} // namespace

int main() {
  int passed = 0;
  storysync::set_log_level(spdlog::level::off);

  // --- extract_preview ---
  {
    auto result = storysync::extract_preview(make_story("a", "Foo", 3, "Mystery"));
    auto *p = std::get_if<storysync::story_preview>(&result);
    assert(p != nullptr);
    ++passed;
    assert(p->id == "a" && p->title == "Foo");
    ++passed;
    assert(p->genre == std::optional<std::string>("Mystery"));
    ++passed;
    assert(p->updated_at == 1700000000123LL);
    ++passed;
    assert(p->entry_count == 3);
    ++passed;

    result = storysync::extract_preview(R"({"story":{}})");
    p = std::get_if<storysync::story_preview>(&result);
    assert(p != nullptr);
    ++passed;
    assert(p->id.empty() && p->title == "Untitled");
    ++passed;
    assert(!p->genre && p->updated_at == 0 && p->entry_count == 0);
    ++passed;

    result = storysync::extract_preview("{not json");
    auto *failure = std::get_if<storysync::extraction_failure>(&result);
    assert(failure != nullptr);
    ++passed;
    assert(failure->reason.find("Invalid JSON") != std::string::npos);
    ++passed;

    result = storysync::extract_preview(R"({"entries":[]})");
    failure = std::get_if<storysync::extraction_failure>(&result);
    assert(failure != nullptr);
    ++passed;
    assert(failure->reason.find("story") != std::string::npos);
    ++passed;
  }

  // --- create drops what cannot be previewed ---
  std::vector<std::string> inputs = {
      make_story("a", "Foo", 3), "garbage", make_story("b", "Bar", 0),
      R"({"title":"no story object"})", make_story("c", "Baz", 1, "Horror")};
  auto sess = storysync::session::create("secret", inputs);
  {
    auto previews = sess->list_previews();
    assert(previews.size() == 3);
    ++passed;
    assert(previews[0].id == "a" && previews[1].id == "b" &&
           previews[2].id == "c");
    ++passed;
    assert(sess->offered_count() == 3);
    ++passed;
    assert(sess->token() == "secret");
    ++passed;
  }

  // --- custom extractor ---
  {
    auto only_short = [](const std::string &payload) -> storysync::preview_result {
      if (payload.size() > 4)
        return storysync::extraction_failure{"too long"};
      storysync::story_preview p;
      p.id = payload;
      p.title = payload;
      return p;
    };
    auto custom = storysync::session::create("t", {"x", "yy", "zzzzzz"}, only_short);
    assert(custom->offered_count() == 2);
    ++passed;
    assert(custom->find_payload("yy") == std::optional<std::string>("yy"));
    ++passed;
  }

  // --- records that cannot be encoded are skipped ---
  {
    auto as_title = [](const std::string &payload) -> storysync::preview_result {
      storysync::story_preview p;
      p.id = std::to_string(payload.size());
      p.title = payload;
      return p;
    };
    auto mixed = storysync::session::create("t", {"caf\xe9", "fine"}, as_title);
    assert(mixed->offered_count() == 1);
    ++passed;
    assert(mixed->find_payload("4") == std::optional<std::string>("fine"));
    ++passed;
    auto resp = storysync::handle(*mixed, request("t", storysync::action::list_stories{}));
    auto listed = storysync::serialize_response(resp);
    assert(listed.find("fine") != std::string::npos);
    ++passed;
  }

  // --- find_payload is an exact match ---
  assert(sess->find_payload("a") == std::optional<std::string>(inputs[0]));
  ++passed;
  assert(!sess->find_payload("A"));
  ++passed;
  assert(!sess->find_payload(""));
  ++passed;

  // --- token check precedes every action ---
  {
    std::vector<storysync::sync_action> actions = {
        storysync::action::list_stories{}, storysync::action::pull_story{"a"},
        storysync::action::push_story{"pushed"}};
    for (const auto &act : actions) {
      for (const char *bad : {"", "secreT", "secret ", "other"}) {
        auto resp = storysync::handle(*sess, request(bad, act));
        auto *err = std::get_if<storysync::response::error>(&resp);
        assert(err != nullptr);
        assert(err->message == "Invalid authentication token");
      }
    }
    ++passed;
    assert(sess->peek_received().empty());
    ++passed;
  }

  // --- dispatch ---
  {
    auto resp = storysync::handle(*sess, request("secret", storysync::action::list_stories{}));
    auto *list = std::get_if<storysync::response::stories_list>(&resp);
    assert(list != nullptr && list->stories.size() == 3);
    ++passed;
    assert(list->stories[2].genre == std::optional<std::string>("Horror"));
    ++passed;

    resp = storysync::handle(*sess, request("secret", storysync::action::pull_story{"b"}));
    auto *data = std::get_if<storysync::response::story_data>(&resp);
    assert(data != nullptr && data->data == inputs[2]);
    ++passed;

    resp = storysync::handle(*sess,
                             request("secret", storysync::action::pull_story{"no such id"}));
    auto *err = std::get_if<storysync::response::error>(&resp);
    assert(err != nullptr);
    ++passed;
    assert(err->message == "Story not found: no such id");
    ++passed;

    resp = storysync::handle(*sess, request("secret", storysync::action::push_story{"one"}));
    auto *ok = std::get_if<storysync::response::success>(&resp);
    assert(ok != nullptr && ok->message == "Story received successfully");
    ++passed;
    resp = storysync::handle(*sess, request("secret", storysync::action::push_story{""}));
    assert(std::holds_alternative<storysync::response::success>(resp));
    ++passed;
    resp = storysync::handle(*sess, request("secret", storysync::action::push_story{"three"}));
    assert(std::holds_alternative<storysync::response::success>(resp));
    ++passed;

    // pushes never touch what is offered
    assert(sess->offered_count() == 3);
    ++passed;
  }

  // --- received collection ---
  {
    auto peeked = sess->peek_received();
    assert((peeked == std::vector<std::string>{"one", "", "three"}));
    ++passed;
    assert(sess->peek_received() == peeked);
    ++passed;
    auto drained = sess->drain_received();
    assert(drained == peeked);
    ++passed;
    assert(sess->peek_received().empty());
    ++passed;
    assert(sess->drain_received().empty());
    ++passed;
  }

  // --- concurrent pushes keep each writer's order ---
  {
    constexpr int kWriters = 8;
    constexpr int kPerWriter = 50;
    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
      writers.emplace_back([&sess, w]() {
        for (int i = 0; i < kPerWriter; ++i) {
          auto payload = std::to_string(w) + ":" + std::to_string(i);
          auto resp = storysync::handle(
              *sess, storysync::sync_request{"secret",
                                             storysync::action::push_story{payload}});
          assert(std::holds_alternative<storysync::response::success>(resp));
          (void)resp;
        }
      });
    }
    std::thread reader([&sess]() {
      for (int i = 0; i < 100; ++i)
        (void)sess->list_previews();
    });
    for (auto &t : writers)
      t.join();
    reader.join();

    auto received = sess->drain_received();
    assert(received.size() == kWriters * kPerWriter);
    ++passed;

    std::vector<int> next(kWriters, 0);
    for (const auto &item : received) {
      auto colon = item.find(':');
      int w = std::stoi(item.substr(0, colon));
      int i = std::stoi(item.substr(colon + 1));
      assert(i == next[w]);
      next[w] = i + 1;
    }
    ++passed;
  }

  // --- http routing ---
  {
    storysync::http_request req;
    req.method = "POST";
    req.path = "/other";
    req.body = storysync::serialize_request(request("secret", storysync::action::list_stories{}));
    assert(storysync::handle_http(*sess, req).status == 404);
    ++passed;

    req.path = "/sync";
    req.method = "GET";
    assert(storysync::handle_http(*sess, req).status == 405);
    ++passed;

    req.method = "POST";
    auto resp = storysync::handle_http(*sess, req);
    assert(resp.status == 200);
    ++passed;
    assert(resp.content_type == "application/json");
    ++passed;
    auto decoded = storysync::parse_response(resp.body);
    assert(std::holds_alternative<storysync::response::stories_list>(decoded));
    ++passed;

    req.body = R"({"token":"secret","action":{"type":"pushStory"}})";
    resp = storysync::handle_http(*sess, req);
    assert(resp.status == 400);
    ++passed;
    assert(sess->peek_received().empty());
    ++passed;

    req.body = storysync::serialize_request(request("wrong", storysync::action::list_stories{}));
    resp = storysync::handle_http(*sess, req);
    assert(resp.status == 200);
    ++passed;
    decoded = storysync::parse_response(resp.body);
    assert(std::get<storysync::response::error>(decoded).message ==
           "Invalid authentication token");
    ++passed;
  }

  std::printf("%d passed, 0 failed\n", passed);
  return 0;
}
