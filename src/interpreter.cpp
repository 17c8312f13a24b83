#include "applogic/interpreter.hpp"

#include <variant>

#include "applogic/evaluator.hpp"
#include "applogic/path.hpp"

namespace applogic {

std::string to_string(RunStatus status) {
  switch (status) {
    case RunStatus::returned:  return "returned";
    case RunStatus::completed: return "completed";
    case RunStatus::errored:   return "errored";
    case RunStatus::exhausted: return "exhausted";
  }
  return "unknown";
}

namespace {

enum class Flow { next, stop };

// Pops a loop binding on every exit path.
class BindingScope {
 public:
  BindingScope(ExecutionContext& ctx, const std::string& name) : ctx_(ctx) { ctx_.push_binding(name, Value{}); }
  ~BindingScope() { ctx_.pop_binding(); }
  BindingScope(const BindingScope&) = delete;
  BindingScope& operator=(const BindingScope&) = delete;

 private:
  ExecutionContext& ctx_;
};

// One run of one action. Owns the outcome being built.
struct Run {
  ExecutionContext&       ctx;
  const FunctionRegistry& functions;
  RunOutcome              out;

  // `code` overrides the reported code string for author-defined codes.
  Flow fail(ErrorCode kind, const std::string& message, const std::string& code = "") {
    const ErrorCategory category = category_of(kind);
    out.status = category == ErrorCategory::safety_limit ? RunStatus::exhausted : RunStatus::errored;
    out.error = ActionError{category, kind, code.empty() ? to_string(kind) : code, message};
    out.value = Value{};
    return Flow::stop;
  }

  Flow fail(const Error& e) { return fail(e.code, e.message); }

  // Evaluates `e`; on failure records the error and returns nullopt.
  std::optional<Value> eval(const Expression& e) {
    if (e.empty()) return Value{};
    std::optional<Error> err;
    Value v = evaluate(*e.root, ctx, functions, &err);
    if (err) {
      fail(*err);
      return std::nullopt;
    }
    return v;
  }

  std::optional<bool> condition(const Expression& e, const char* block) {
    auto v = eval(e);
    if (!v) return std::nullopt;
    if (!v->is_bool()) {
      fail(ErrorCode::type_mismatch,
           std::string(block) + " condition must be a boolean, got " + to_string(v->type()));
      return std::nullopt;
    }
    return v->as_bool();
  }

  std::optional<std::string> text(const Expression& e) {
    auto v = eval(e);
    if (!v) return std::nullopt;
    return to_display_string(*v);
  }

  Flow exec(const BlockList& blocks) {
    for (const auto& block : blocks) {
      ++out.blocks_executed;
      const Flow f = std::visit([this](const auto& b) { return exec_block(b); }, block.node);
      if (f == Flow::stop) return f;
    }
    return Flow::next;
  }

  Flow exec_block(const ValidateBlock& b) {
    auto ok = condition(b.condition, "validate");
    if (!ok) return Flow::stop;
    if (*ok) return Flow::next;
    auto msg = text(b.error_message);
    if (!msg) return Flow::stop;
    return fail(ErrorCode::validation_failed, *msg, b.error_code);
  }

  // Turns an evaluated index into a path segment: strings are map keys,
  // non-negative integral numbers are list positions.
  std::optional<PathSegment> segment(const Value& v) {
    if (v.is_string()) return PathSegment::of_key(v.as_string());
    if (v.is_number() && is_integral(v.as_number()) && v.as_number() >= 0) {
      return PathSegment::of_index(static_cast<std::size_t>(v.as_number()));
    }
    fail(ErrorCode::type_mismatch,
         "update target index must be a string or a non-negative integer, got " + to_string(v.type()));
    return std::nullopt;
  }

  bool append_steps(const std::vector<ChainStep>& steps, std::size_t from, Path* path) {
    for (std::size_t i = from; i < steps.size(); ++i) {
      if (!steps[i].index) {
        path->push_back(PathSegment::of_key(steps[i].key));
        continue;
      }
      std::optional<Error> err;
      Value idx = evaluate(*steps[i].index, ctx, functions, &err);
      if (err) {
        fail(*err);
        return false;
      }
      auto seg = segment(idx);
      if (!seg) return false;
      path->push_back(std::move(*seg));
    }
    return true;
  }

  Flow exec_block(const UpdateBlock& b) {
    std::string root;
    std::vector<ChainStep> steps;
    if (b.target.empty() || !decompose_chain(*b.target.root, &root, &steps)) {
      return fail(ErrorCode::invalid_argument, "update target is not a path");
    }

    auto operand = eval(b.value);
    if (!operand) return Flow::stop;

    // Partition: empty agent_id selects shared state.
    std::optional<std::string> agent_id;
    Path path;
    if (root == "agent") {
      agent_id = ctx.agent_id();
      if (!append_steps(steps, 0, &path)) return Flow::stop;
    } else if (root == "agents") {
      if (steps.empty() || !steps[0].index) {
        return fail(ErrorCode::invalid_argument, "agents target must be indexed by agent id");
      }
      std::optional<Error> err;
      Value id = evaluate(*steps[0].index, ctx, functions, &err);
      if (err) return fail(*err);
      if (!id.is_string()) {
        return fail(ErrorCode::type_mismatch, "agent id must be a string, got " + to_string(id.type()));
      }
      agent_id = id.as_string();
      if (!append_steps(steps, 1, &path)) return Flow::stop;
    } else if (root == "shared") {
      if (!append_steps(steps, 0, &path)) return Flow::stop;
    } else {
      const StateField* f = ctx.definition().find_field(root);
      if (!f) {
        return fail(ErrorCode::path_not_found, "unknown state field '" + root + "'");
      }
      if (f->per_agent) agent_id = ctx.agent_id();
      path.push_back(PathSegment::of_key(root));
      if (!append_steps(steps, 0, &path)) return Flow::stop;
    }
    if (path.empty()) {
      return fail(ErrorCode::invalid_argument, "update target must name a field");
    }

    AppState& state = ctx.mutable_state();
    Map& partition = agent_id ? ensure_agent(state, ctx.definition(), *agent_id) : state.shared_map();
    std::optional<Error> err = apply_update(partition, path, b.operation, *operand);
    ctx.mark_state_changed();
    if (err) return fail(*err);

    if (auto limit = ctx.governor().check_state(ctx.state())) return fail(*limit);
    return Flow::next;
  }

  Flow exec_block(const NotifyBlock& b) {
    Notification n;
    if (b.to) {
      auto to = eval(*b.to);
      if (!to) return Flow::stop;
      if (!to->is_string()) {
        return fail(ErrorCode::type_mismatch, "notify target must be a string, got " + to_string(to->type()));
      }
      n.target = to->as_string();
    } else {
      n.broadcast = true;
    }
    auto msg = text(b.message);
    if (!msg) return Flow::stop;
    n.message = std::move(*msg);
    if (b.data) {
      auto data = eval(*b.data);
      if (!data) return Flow::stop;
      n.data = data->is_map() ? std::move(*data) : Value{Map{{"value", std::move(*data)}}};
    }
    out.notifications.push_back(std::move(n));
    return Flow::next;
  }

  Flow exec_block(const ReturnBlock& b) {
    Value v;
    if (b.value) {
      auto r = eval(*b.value);
      if (!r) return Flow::stop;
      v = std::move(*r);
    }
    out.status = RunStatus::returned;
    out.value = std::move(v);
    return Flow::stop;
  }

  Flow exec_block(const ErrorBlock& b) {
    auto msg = text(b.message);
    if (!msg) return Flow::stop;
    return fail(ErrorCode::action_error, *msg, b.code);
  }

  Flow exec_block(const BranchBlock& b) {
    auto c = condition(b.condition, "branch");
    if (!c) return Flow::stop;
    BodyScope scope(ctx.governor());
    if (scope.error()) return fail(*scope.error());
    return exec(*c ? b.then_blocks : b.else_blocks);
  }

  Flow exec_block(const LoopBlock& b) {
    auto iterable = eval(b.iterable);
    if (!iterable) return Flow::stop;
    if (iterable->is_null()) return Flow::next;
    if (!iterable->is_list()) {
      return fail(ErrorCode::type_mismatch, "loop iterable must be a list, got " + to_string(iterable->type()));
    }
    BodyScope scope(ctx.governor());
    if (scope.error()) return fail(*scope.error());
    BindingScope binding(ctx, b.binding);
    for (const auto& item : iterable->as_list()) {
      if (auto limit = ctx.governor().enter_iteration()) return fail(*limit);
      ctx.set_binding(item);
      if (exec(b.body) == Flow::stop) return Flow::stop;
    }
    return Flow::next;
  }
};

}  // namespace

RunOutcome Interpreter::run(const ActionDefinition& action, ExecutionContext& ctx) const {
  Run r{ctx, functions_, {}};
  if (r.exec(action.logic) == Flow::next) {
    r.out.status = RunStatus::completed;
    r.out.value = Value{};
  }
  return std::move(r.out);
}

}  // namespace applogic
