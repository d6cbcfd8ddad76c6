#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <vector>

#include "controller_types.hpp"

namespace gambit::model
{
  struct IRuleEngine;
}

namespace gambit::controller
{

  // Decides which squares a piece may reach and whether a proposed move stands.
  // Strategies never mutate the snapshot they are handed; an accepted outcome carries
  // a new one.
  struct ILegalityStrategy
  {
    virtual ~ILegalityStrategy() = default;

    virtual std::vector<core::Square> reachableTargets(core::Square from,
                                                       const model::BoardSnapshot &snap) = 0;
    virtual MoveOutcome proposeMove(const MoveIntent &intent, const model::BoardSnapshot &snap) = 0;

    // Asynchronous strategies are driven through submitMove and polled by the controller.
    [[nodiscard]] virtual bool isAsynchronous() const { return false; }
    virtual std::future<MoveOutcome> submitMove(const MoveIntent &intent,
                                                const model::BoardSnapshot &snap);
  };

  // Pawn arriving on the farthest rank for its side.
  [[nodiscard]] bool requiresPromotion(const model::BoardSnapshot &snap, const MoveIntent &intent);

  class RuleEngineStrategy : public ILegalityStrategy
  {
  public:
    explicit RuleEngineStrategy(std::shared_ptr<model::IRuleEngine> engine);

    std::vector<core::Square> reachableTargets(core::Square from,
                                               const model::BoardSnapshot &snap) override;
    MoveOutcome proposeMove(const MoveIntent &intent, const model::BoardSnapshot &snap) override;

    [[nodiscard]] const std::shared_ptr<model::IRuleEngine> &engine() const { return m_engine; }

  private:
    // Loads the snapshot into the engine unless it already holds that position.
    void syncEngine(const model::BoardSnapshot &snap);

    std::shared_ptr<model::IRuleEngine> m_engine;
  };

  class BypassStrategy : public ILegalityStrategy
  {
  public:
    std::vector<core::Square> reachableTargets(core::Square from,
                                               const model::BoardSnapshot &snap) override;
    MoveOutcome proposeMove(const MoveIntent &intent, const model::BoardSnapshot &snap) override;
  };

  // Runs the wrapped strategy's proposals on a worker thread. Every call into the wrapped
  // strategy holds one lock, so a target query waits for a running proposal to finish.
  class AsyncLegalityStrategy : public ILegalityStrategy
  {
  public:
    explicit AsyncLegalityStrategy(std::shared_ptr<ILegalityStrategy> inner);

    std::vector<core::Square> reachableTargets(core::Square from,
                                               const model::BoardSnapshot &snap) override;
    MoveOutcome proposeMove(const MoveIntent &intent, const model::BoardSnapshot &snap) override;

    [[nodiscard]] bool isAsynchronous() const override { return true; }
    std::future<MoveOutcome> submitMove(const MoveIntent &intent,
                                        const model::BoardSnapshot &snap) override;

  private:
    std::shared_ptr<ILegalityStrategy> m_inner;
    // shared with workers that may outlive this strategy
    std::shared_ptr<std::mutex> m_mutex;
  };

} // namespace gambit::controller
