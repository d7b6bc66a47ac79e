// Copyright (c) 2026 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "source/reduce/reducer.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "source/reduce/make_alnum_reduction_pass.h"
#include "source/reduce/reduction_pass.h"
#include "source/reduce/remove_head_reduction_pass.h"
#include "source/reduce/remove_middle_reduction_pass.h"
#include "source/reduce/remove_tail_reduction_pass.h"
#include "source/reduce/replace_balanced_reduction_pass.h"
#include "source/reduce/replace_substitution_reduction_pass.h"
#include "source/reduce/shorten_identifier_reduction_pass.h"

namespace symtools {
namespace reduce {

namespace {
const char kSource[] = "Reducer";
}  // namespace

struct Reducer::Impl {
  Impl(Oracle* o, const ReducerOptions& opts)
      : oracle(o),
        options(opts),
        consumer(IgnoreMessage),
        shorten_identifiers(std::make_unique<ShortenIdentifierReductionPass>(
            o, opts.GetQuiet())),
        remove_head(
            std::make_unique<RemoveHeadReductionPass>(o, opts.GetQuiet())),
        remove_tail(
            std::make_unique<RemoveTailReductionPass>(o, opts.GetQuiet())),
        replace_balanced(
            std::make_unique<ReplaceBalancedReductionPass>(o, opts.GetQuiet())),
        replace_substitutions(
            std::make_unique<ReplaceSubstitutionReductionPass>(
                o, opts.GetQuiet())),
        remove_middle_linear(std::make_unique<RemoveMiddleReductionPass>(
            o, opts.GetQuiet(), RemoveMiddleReductionPass::Variant::Linear)),
        remove_middle_quadratic(std::make_unique<RemoveMiddleReductionPass>(
            o, opts.GetQuiet(), RemoveMiddleReductionPass::Variant::Quadratic)),
        make_alnum(
            std::make_unique<MakeAlnumReductionPass>(o, opts.GetQuiet())) {}

  Oracle* oracle;
  const ReducerOptions options;
  MessageConsumer consumer;

  std::unique_ptr<ReductionPass> shorten_identifiers;
  std::unique_ptr<ReductionPass> remove_head;
  std::unique_ptr<ReductionPass> remove_tail;
  std::unique_ptr<ReductionPass> replace_balanced;
  std::unique_ptr<ReductionPass> replace_substitutions;
  std::unique_ptr<ReductionPass> remove_middle_linear;
  std::unique_ptr<ReductionPass> remove_middle_quadratic;
  std::unique_ptr<ReductionPass> make_alnum;

  void Trace(const std::string& message) const {
    consumer(MessageLevel::Debug, kSource, message.c_str());
  }

  // Applies |pass| to |*current|, to fixpoint if |to_fixpoint| is set, and
  // commits the outcome.  |*changed| tells whether |*current| was replaced.
  // Returns false if the run has to stop, in which case |*status| says why.
  bool Step(ReductionPass* pass, bool to_fixpoint, std::string* current,
            ReductionCache* cache, bool* changed,
            ReductionStatus* status) const;

  // Runs remove head and remove tail in turn until both fail in a row.
  bool RemoveHeadAndTail(std::string* current, ReductionCache* cache,
                         ReductionStatus* status) const;
};

bool Reducer::Impl::Step(ReductionPass* pass, bool to_fixpoint,
                         std::string* current, ReductionCache* cache,
                         bool* changed, ReductionStatus* status) const {
  std::string next;
  *changed = to_fixpoint ? pass->ApplyToFixpoint(*current, &next)
                         : pass->ApplyOnce(*current, &next);
  if (oracle->HasFailed()) {
    consumer(MessageLevel::Error, kSource,
             ("Oracle failed during pass " + pass->GetName() + "; stopping.")
                 .c_str());
    *status = ReductionStatus::OracleFailure;
    return false;
  }
  if (!*changed) {
    return true;
  }
  *current = std::move(next);
  if (cache != nullptr && !cache->Insert(*current)) {
    Trace("Pass " + pass->GetName() +
          " reached a testcase seen before; stopping.");
    *status = ReductionStatus::NoNewResult;
    return false;
  }
  return true;
}

bool Reducer::Impl::RemoveHeadAndTail(std::string* current,
                                      ReductionCache* cache,
                                      ReductionStatus* status) const {
  ReductionPass* const group[] = {remove_head.get(), remove_tail.get()};
  const size_t group_size = sizeof(group) / sizeof(group[0]);
  size_t unchanged_turns = 0;
  for (size_t turn = 0; unchanged_turns < group_size; ++turn) {
    bool changed = false;
    if (!Step(group[turn % group_size], false, current, cache, &changed,
              status)) {
      return false;
    }
    unchanged_turns = changed ? 0 : unchanged_turns + 1;
  }
  return true;
}

Reducer::Reducer(Oracle* oracle, const ReducerOptions& options)
    : impl_(std::make_unique<Impl>(oracle, options)) {}

Reducer::~Reducer() = default;

void Reducer::SetMessageConsumer(MessageConsumer c) {
  for (ReductionPass* pass :
       {impl_->shorten_identifiers.get(), impl_->remove_head.get(),
        impl_->remove_tail.get(), impl_->replace_balanced.get(),
        impl_->replace_substitutions.get(), impl_->remove_middle_linear.get(),
        impl_->remove_middle_quadratic.get(), impl_->make_alnum.get()}) {
    pass->SetMessageConsumer(c);
  }
  impl_->consumer = std::move(c);
}

ReductionStatus Reducer::Run(const std::string& testcase, std::string* result,
                             ReductionCache* cache) const {
  *result = testcase;
  if (cache != nullptr && !cache->Insert(testcase)) {
    impl_->Trace("Testcase was processed before; nothing to do.");
    return ReductionStatus::NoNewResult;
  }

  std::string current = testcase;
  ReductionStatus status = ReductionStatus::Complete;
  bool changed = false;

  impl_->Trace("Shortening identifiers.");
  if (!impl_->Step(impl_->shorten_identifiers.get(), false, &current, cache,
                   &changed, &status)) {
    *result = current;
    return status;
  }

  for (uint32_t round = 1;; ++round) {
    impl_->Trace("Starting round " + std::to_string(round) + ".");

    if (!impl_->RemoveHeadAndTail(&current, cache, &status)) {
      break;
    }

    if (!impl_->Step(impl_->replace_balanced.get(), true, &current, cache,
                     &changed, &status)) {
      break;
    }
    if (changed) continue;

    if (!impl_->Step(impl_->replace_substitutions.get(), true, &current,
                     cache, &changed, &status)) {
      break;
    }
    if (changed) continue;

    if (!impl_->Step(impl_->remove_middle_linear.get(), true, &current, cache,
                     &changed, &status)) {
      break;
    }
    bool removed_middle = changed;
    if (impl_->options.GetSlowMode()) {
      if (!impl_->Step(impl_->remove_middle_quadratic.get(), true, &current,
                       cache, &changed, &status)) {
        break;
      }
      removed_middle = removed_middle || changed;
    }
    if (removed_middle) continue;

    impl_->Trace("No pass made progress; converged.");
    if (impl_->options.GetFixNonAlnum()) {
      impl_->Step(impl_->make_alnum.get(), false, &current, cache, &changed,
                  &status);
    }
    break;
  }

  *result = current;
  return status;
}

}  // namespace reduce
}  // namespace symtools
