#include "SubscriberDirectory.hpp"

#include "TestHeaders.hpp"

using namespace fsn;

namespace {
SubscriberMessage makeStop(const string& name) {
  SubscriberMessage message;
  message.set_monitor(name);
  message.mutable_stop()->set_name(name);
  return message;
}
}  // namespace

TEST_CASE("Dispatch reaches each subscriber once", "[SubscriberDirectory]") {
  SubscriberDirectory directory;
  auto first = make_shared<Mailbox>();
  auto second = make_shared<Mailbox>();
  directory.subscribe("m", first);
  directory.subscribe("m", first);
  directory.subscribe("m", second);
  REQUIRE(directory.numRegistrations("m") == 3);

  REQUIRE(directory.dispatch("m", makeStop("m")) == 2);
  REQUIRE(first->size() == 1);
  REQUIRE(second->size() == 1);
  REQUIRE(directory.getSubscribers("m").size() == 2);
}

TEST_CASE("Names are independent", "[SubscriberDirectory]") {
  SubscriberDirectory directory;
  auto a = make_shared<Mailbox>();
  auto b = make_shared<Mailbox>();
  directory.subscribe("a", a);
  directory.subscribe("b", b);

  REQUIRE(directory.dispatch("a", makeStop("a")) == 1);
  REQUIRE(a->size() == 1);
  REQUIRE(b->size() == 0);
  REQUIRE(directory.dispatch("nobody", makeStop("nobody")) == 0);
}

TEST_CASE("Unsubscribe removes every registration", "[SubscriberDirectory]") {
  SubscriberDirectory directory;
  auto mailbox = make_shared<Mailbox>();
  auto other = make_shared<Mailbox>();
  directory.subscribe("m", mailbox);
  directory.subscribe("m", mailbox);
  directory.subscribe("m", other);

  directory.unsubscribe("m", mailbox);
  REQUIRE(directory.numRegistrations("m") == 1);
  REQUIRE(directory.dispatch("m", makeStop("m")) == 1);
  REQUIRE(mailbox->size() == 0);

  // Unsubscribing twice is harmless
  directory.unsubscribe("m", mailbox);
  directory.unsubscribe("missing", mailbox);
  REQUIRE(directory.numRegistrations("m") == 1);
}

TEST_CASE("Destroyed mailboxes are pruned", "[SubscriberDirectory]") {
  SubscriberDirectory directory;
  auto survivor = make_shared<Mailbox>();
  {
    auto transient = make_shared<Mailbox>();
    directory.subscribe("m", transient);
  }
  directory.subscribe("m", survivor);
  REQUIRE(directory.numRegistrations("m") == 2);

  REQUIRE(directory.dispatch("m", makeStop("m")) == 1);
  REQUIRE(directory.numRegistrations("m") == 1);
}

TEST_CASE("Full mailboxes do not block dispatch", "[SubscriberDirectory]") {
  SubscriberDirectory directory;
  auto tiny = make_shared<Mailbox>(1);
  auto roomy = make_shared<Mailbox>();
  directory.subscribe("m", tiny);
  directory.subscribe("m", roomy);

  REQUIRE(directory.dispatch("m", makeStop("m")) == 2);
  REQUIRE(directory.dispatch("m", makeStop("m")) == 1);
  REQUIRE(tiny->droppedCount() == 1);
  REQUIRE(roomy->size() == 2);
}

TEST_CASE("Concurrent subscribe and dispatch", "[SubscriberDirectory]") {
  SubscriberDirectory directory;
  auto anchor = make_shared<Mailbox>(100000);
  directory.subscribe("m", anchor);

  std::atomic<bool> done(false);
  std::thread churn([&]() {
    while (!done) {
      auto mailbox = make_shared<Mailbox>();
      directory.subscribe("m", mailbox);
      directory.unsubscribe("m", mailbox);
    }
  });
  for (int i = 0; i < 1000; i++) {
    REQUIRE(directory.dispatch("m", makeStop("m")) >= 1);
  }
  done = true;
  churn.join();
  REQUIRE(anchor->size() == 1000);
}

TEST_CASE("The shared directory is created once", "[SubscriberDirectory]") {
  REQUIRE(SubscriberDirectory::get() == SubscriberDirectory::get());
}
