// Copyright 2026 H2Mimic Authors
// SPDX-License-Identifier: MIT

#include "h2mimic/http/ordered_headers.h"

#include <cassert>
#include <print>
#include <string>

using namespace h2mimic;
namespace headers = h2mimic::http::headers;

void TestSetGetHasDelete() {
  std::print("Testing Set/Get/Has/Delete... ");

  headers::OrderedHeaders h;
  assert(h.headers.empty());

  headers::Set(h, "Content-Type", "application/json");
  headers::Set(h, "Accept", "text/html");
  assert(h.headers.size() == 2);
  assert(headers::Has(h, "Accept"));
  assert(headers::Get(h, "Content-Type") == "application/json");

  assert(headers::Delete(h, "Content-Type"));
  assert(h.headers.size() == 1);
  assert(!headers::Has(h, "Content-Type"));
  assert(headers::Get(h, "Content-Type").empty());

  assert(!headers::Delete(h, "X-NonExistent"));
  assert(h.headers.size() == 1);

  std::println("PASSED");
}

void TestSetPreservesPosition() {
  std::print("Testing Set replaces value in place... ");

  headers::OrderedHeaders h;
  headers::Set(h, "First", "1");
  headers::Set(h, "Second", "2");
  headers::Set(h, "Third", "3");
  headers::Set(h, "SECOND", "updated");

  assert(h.headers.size() == 3);
  assert(h.headers[0].name == "First");
  assert(h.headers[1].name == "Second");  // Original spelling kept
  assert(h.headers[1].value == "updated");
  assert(h.headers[2].name == "Third");

  std::println("PASSED");
}

void TestCaseInsensitiveLookup() {
  std::print("Testing case-insensitive lookup... ");

  headers::OrderedHeaders h;
  headers::Add(h, "X-Client-Profile", "firefox");

  assert(headers::Has(h, "x-client-profile"));
  assert(headers::Has(h, "X-CLIENT-PROFILE"));
  assert(headers::Get(h, "x-Client-profile") == "firefox");
  assert(!headers::Has(h, "x-client-profil"));
  assert(!headers::Has(h, "x-client-profiles"));

  std::println("PASSED");
}

void TestAddAndGetAll() {
  std::print("Testing Add keeps duplicates in order... ");

  headers::OrderedHeaders h;
  headers::Add(h, "Cookie", "a=1");
  headers::Add(h, "Accept", "*/*");
  headers::Add(h, "cookie", "b=2");
  headers::Add(h, "COOKIE", "c=3");

  auto cookies = headers::GetAll(h, "Cookie");
  assert(cookies.size() == 3);
  assert(cookies[0] == "a=1");
  assert(cookies[1] == "b=2");
  assert(cookies[2] == "c=3");

  // Get returns the first
  assert(headers::Get(h, "cookie") == "a=1");
  assert(headers::GetAll(h, "missing").empty());

  std::println("PASSED");
}

void TestDeleteRemovesAllAndKeepsOrder() {
  std::print("Testing Delete removes all matches, keeps survivors in order... ");

  headers::OrderedHeaders h;
  headers::Add(h, "a", "1");
  headers::Add(h, "x", "drop");
  headers::Add(h, "b", "2");
  headers::Add(h, "X", "drop");
  headers::Add(h, "c", "3");

  assert(headers::Delete(h, "x"));
  assert(h.headers.size() == 3);
  assert(h.headers[0].name == "a");
  assert(h.headers[1].name == "b");
  assert(h.headers[2].name == "c");

  std::println("PASSED");
}

void TestTake() {
  std::print("Testing Take returns first value and removes all... ");

  headers::OrderedHeaders h;
  headers::Add(h, "accept", "*/*");
  headers::Add(h, "X-Token", "first");
  headers::Add(h, "user-agent", "ua");
  headers::Add(h, "x-token", "second");

  auto taken = headers::Take(h, "x-token");
  assert(taken);
  assert(*taken == "first");
  assert(!headers::Has(h, "x-token"));
  assert(h.headers.size() == 2);
  assert(h.headers[0].name == "accept");
  assert(h.headers[1].name == "user-agent");

  auto again = headers::Take(h, "x-token");
  assert(!again);
  assert(h.headers.size() == 2);

  std::println("PASSED");
}

void TestFromVectorAndClear() {
  std::print("Testing FromVector/Clear... ");

  Headers vec = {{"Host", "example.com"}, {"Accept", "*/*"}};
  auto h = headers::FromVector(vec);
  assert(h.headers == vec);
  assert(headers::Get(h, "host") == "example.com");

  headers::Clear(h);
  assert(h.headers.empty());
  assert(!headers::Has(h, "host"));

  // Usable after clear
  headers::Set(h, "Accept", "text/html");
  assert(h.headers.size() == 1);

  std::println("PASSED");
}

void TestCopyIsIndependent() {
  std::print("Testing copies are independent... ");

  headers::OrderedHeaders original;
  headers::Add(original, "a", "1");
  headers::Add(original, "b", "2");

  headers::OrderedHeaders copy = original;
  headers::Set(copy, "a", "changed");
  headers::Delete(copy, "b");

  assert(headers::Get(original, "a") == "1");
  assert(headers::Has(original, "b"));
  assert(headers::Get(copy, "a") == "changed");
  assert(!headers::Has(copy, "b"));

  std::println("PASSED");
}

void TestManyHeadersSurviveGrowth() {
  std::print("Testing lookups across vector growth... ");

  headers::OrderedHeaders h;
  for (int i = 0; i < 200; ++i) {
    headers::Add(h, "X-Header-" + std::to_string(i), std::to_string(i));
  }

  assert(h.headers.size() == 200);
  assert(headers::Get(h, "x-header-0") == "0");
  assert(headers::Get(h, "X-HEADER-199") == "199");
  for (int i = 0; i < 200; ++i) {
    assert(h.headers[i].value == std::to_string(i));
  }

  std::println("PASSED");
}

int main() {
  std::println("=== OrderedHeaders Unit Tests ===\n");

  TestSetGetHasDelete();
  TestSetPreservesPosition();
  TestCaseInsensitiveLookup();
  TestAddAndGetAll();
  TestDeleteRemovesAllAndKeepsOrder();
  TestTake();
  TestFromVectorAndClear();
  TestCopyIsIndependent();
  TestManyHeadersSurviveGrowth();

  std::println("\nAll OrderedHeaders tests passed!");
  return 0;
}
