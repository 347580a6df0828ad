#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/document.hpp"

namespace eafkit::testing {

/*
  "words": a1 hello [0,500], a2 world [500,1000]
  "translit" (parent words): r1 HELLO -> a1
*/
inline model::Document WordsDocument() {
  model::Tier words;
  words.id = "words";
  words.Add(model::Annotation::Alignable("a1", "hello", "ts1", "ts2"));
  words.Add(model::Annotation::Alignable("a2", "world", "ts3", "ts4"));

  model::Tier translit;
  translit.id         = "translit";
  translit.parent_ref = "words";
  translit.Add(model::Annotation::Referred("r1", "HELLO", "a1"));

  return model::DocumentBuilder()
      .Author("test")
      .Date("2024-01-01T00:00:00+00:00")
      .WithTimeOrder(model::TimeOrder({{"ts1", 0}, {"ts2", 500}, {"ts3", 500}, {"ts4", 1000}}))
      .AddTier(std::move(words))
      .AddTier(std::move(translit))
      .Build();
}

// One main tier, one annotation per (start, end) pair, ids a1.. and ts1...
inline model::Document SingleTierDocument(const std::string& tier_id, const std::vector<std::pair<int64_t, int64_t>>& spans) {
  model::Tier                  tier;
  std::vector<model::TimeSlot> slots;
  tier.id = tier_id;

  for (std::size_t i = 0; i < spans.size(); ++i) {
    const std::string ts1 = "ts" + std::to_string(2 * i + 1);
    const std::string ts2 = "ts" + std::to_string(2 * i + 2);
    slots.push_back({ts1, spans[i].first});
    slots.push_back({ts2, spans[i].second});
    tier.Add(model::Annotation::Alignable("a" + std::to_string(i + 1), "v" + std::to_string(i + 1), ts1, ts2));
  }

  return model::DocumentBuilder()
      .Date("2024-01-01T00:00:00+00:00")
      .WithTimeOrder(model::TimeOrder(std::move(slots)))
      .AddTier(std::move(tier))
      .Build();
}

} // namespace eafkit::testing
