/***
 * Name: nestport::emit::LoweringPlan (impl)
 * Purpose: Naming, base resolution and ordering of emitted classes.
 */
#include "emitter/LoweringPlan.h"
#include "ast/VisitorBase.h"
#include "nestport/exceptions/emission_error.h"
#include <functional>
#include <map>

namespace nestport::emit {

namespace {

std::vector<std::string> splitDotted(const std::string& name) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  for (;;) {
    const auto dot = name.find('.', start);
    parts.push_back(name.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
    if (dot == std::string::npos) { break; }
    start = dot + 1;
  }
  return parts;
}

[[noreturn]] void failAt(const ast::Node& node, const std::string& detail, const std::string& text) {
  throw exceptions::EmissionError(detail, node.file, node.line, node.col, text);
}

// Prefer the reference itself; fall back to the declaring node for synthesized references
[[noreturn]] void failAt(const ast::TypeRef& ref, const ast::Node& owner, const std::string& detail) {
  if (ref.line == 0) { failAt(owner, detail, ref.name); }
  throw exceptions::EmissionError(detail, ref.file, ref.line, ref.col, ref.name);
}

} // namespace

// Source-order walk assigning names and reference edges
class PlanBuilder final : public ast::VisitorBase {
 public:
  explicit PlanBuilder(LoweringPlan& plan) : plan_(plan) {}

  void visit(const ast::File& file) override {
    for (const auto& cls : file.classes) { cls->accept(*this); }
  }
  void visit(const ast::ClassDecl& cls) override { named(cls); }
  void visit(const ast::NestedClassDecl& cls) override { named(cls); }
  void visit(const ast::FieldDecl& field) override {
    for (const auto& decl : field.declarators) {
      if (decl.init) { decl.init->accept(*this); }
    }
  }
  void visit(const ast::MethodDecl& method) override {
    if (method.body) { method.body->accept(*this); }
  }
  void visit(const ast::ConstructorDecl& ctor) override {
    if (ctor.body) { ctor.body->accept(*this); }
  }
  void visit(const ast::AnonymousClassExpr& anon) override {
    auto& info = add(anon);
    info.anon = &anon;
    info.body = &anon.body;
    info.emittedName = info.topLevel->emittedName + "_" + std::to_string(++anonCount_[info.topLevel]);
    // Creation arguments belong to the enclosing scope
    if (anon.args) { anon.args->accept(*this); }
    enter(info, anon.body);
  }
  void visit(const ast::StaticInitializer& init) override {
    if (init.body) { init.body->accept(*this); }
  }
  void visit(const ast::InstanceInitializer& init) override {
    if (init.body) { init.body->accept(*this); }
  }
  void visit(const ast::Parameter&) override {}
  void visit(const ast::OpaqueBody& body) override {
    for (const auto* anon : body.anonymousClasses()) { anon->accept(*this); }
  }
  void visit(const ast::EnumConstant& constant) override {
    if (constant.args) { constant.args->accept(*this); }
    if (constant.classBody) { constant.classBody->accept(*this); }
  }

 private:
  LoweringPlan& plan_;
  ClassInfo* current_{nullptr};
  std::map<const ClassInfo*, int> anonCount_;

  ClassInfo& add(const ast::Node& node) {
    auto info = std::make_unique<ClassInfo>();
    info->node = &node;
    info->parent = current_;
    info->topLevel = current_ != nullptr ? current_->topLevel : info.get();
    if (current_ != nullptr) { current_->inner.push_back(info.get()); }
    auto& ref = *info;
    plan_.byNode_[&node] = info.get();
    plan_.declared_.push_back(info.get());
    if (current_ == nullptr) { plan_.topLevel_.push_back(info.get()); }
    plan_.classes_.push_back(std::move(info));
    return ref;
  }

  void named(const ast::ClassDecl& cls) {
    auto& info = add(cls);
    info.decl = &cls;
    info.body = &cls.body;
    info.simpleName = cls.name;
    info.emittedName = info.parent != nullptr ? info.parent->emittedName + "_" + cls.name : cls.name;
    for (const auto& param : cls.typeParams) { info.typeParams.push_back(param.name); }
    enter(info, cls.body);
  }

  void enter(ClassInfo& info, const ast::ClassBody& body) {
    auto* saved = current_;
    current_ = &info;
    for (const auto* member : body.members) { member->accept(*this); }
    current_ = saved;
  }
};

const ClassInfo* LoweringPlan::find(const ast::Node* node) const {
  const auto it = byNode_.find(node);
  return it == byNode_.end() ? nullptr : it->second;
}

// Member type `name` of `owner`, declared directly or inherited from an in-file base
const ClassInfo* LoweringPlan::member(const ClassInfo* owner, const std::string& name, const int depth) const {
  if (owner == nullptr || depth > static_cast<int>(classes_.size())) { return nullptr; }
  for (const auto* child : owner->inner) {
    if (!child->isAnonymous() && child->simpleName == name) { return child; }
  }
  for (const auto* base : owner->inFileBases) {
    if (const auto* found = member(base, name, depth + 1)) { return found; }
  }
  return nullptr;
}

const ClassInfo* LoweringPlan::resolve(const std::string& name, const ClassInfo* scope) const {
  const auto parts = splitDotted(name);
  const ClassInfo* found = nullptr;
  for (const auto* s = scope; s != nullptr && found == nullptr; s = s->parent) {
    found = member(s, parts.front(), 0);
    if (found == nullptr && s->simpleName == parts.front()) { found = s; }
  }
  if (found == nullptr) {
    for (const auto* top : topLevel_) {
      if (top->simpleName == parts.front()) {
        found = top;
        break;
      }
    }
  }
  for (std::size_t idx = 1; idx < parts.size() && found != nullptr; ++idx) {
    found = member(found, parts[idx], 0);
  }
  return found;
}

namespace {

bool isKnownExternal(const std::string& name, const ast::File& file, const EmitOptions& options) {
  if (options.knownExternalTypes.count(name) != 0) { return true; }
  const auto parts = splitDotted(name);
  for (const auto& imp : file.imports) {
    if (imp.isWildcard || imp.isStatic) { continue; }
    if (imp.name == name) { return true; }
    const auto dot = imp.name.rfind('.');
    const auto simple = dot == std::string::npos ? imp.name : imp.name.substr(dot + 1);
    if (simple == parts.front()) { return true; }
  }
  // Fully qualified reference to a known library type, e.g. java.util.Comparator
  return parts.size() > 1 && options.knownExternalTypes.count(parts.back()) != 0 &&
         !parts.front().empty() && parts.front()[0] >= 'a' && parts.front()[0] <= 'z';
}

} // namespace

void LoweringPlan::resolveBases(const ast::File& file, const EmitOptions& options) {
  // Declaration order visits enclosing classes first, so inherited member types are available
  for (const auto& owned : classes_) {
    auto& info = *owned;
    std::vector<const ast::TypeRef*> refs;
    if (info.decl != nullptr) {
      for (const auto& ref : info.decl->extends) { refs.push_back(&ref); }
      for (const auto& ref : info.decl->implements) { refs.push_back(&ref); }
    } else {
      refs.push_back(&info.anon->base);
    }
    for (const auto* ref : refs) {
      if (const auto* base = resolve(ref->name, info.parent)) {
        if (base == &info) { failAt(*ref, *info.node, "class '" + info.emittedName + "' cannot extend itself"); }
        info.inFileBases.push_back(base);
        continue;
      }
      if (!isKnownExternal(ref->name, file, options)) {
        failAt(*ref, *info.node, "unresolved base type '" + ref->name + "' referenced by '" + info.emittedName + "'");
      }
    }
  }
}

void LoweringPlan::checkCycles() const {
  enum class Color { White, Grey, Black };
  std::unordered_map<const ClassInfo*, Color> color;
  auto visitFrom = [&](const ClassInfo* start, auto& self) -> void {
    color[start] = Color::Grey;
    for (const auto* base : start->inFileBases) {
      const auto state = color[base];
      if (state == Color::Grey) {
        failAt(*start->node, "cyclic inheritance involving '" + base->emittedName + "'", base->emittedName);
      }
      if (state == Color::White) { self(base, self); }
    }
    color[start] = Color::Black;
  };
  for (const auto* info : declared_) {
    if (color[info] == Color::White) { visitFrom(info, visitFrom); }
  }
}

void LoweringPlan::orderEmission() {
  enum class Mark { None, InProgress, Waiting, Done };
  std::unordered_map<const ClassInfo*, Mark> mark;
  std::unordered_map<const ClassInfo*, std::vector<const ClassInfo*>> deferred;

  // Emit `c` once all its in-file bases are done; otherwise wait on the first pending base
  std::function<void(const ClassInfo*)> place;
  std::function<void(const ClassInfo*)> settle = [&](const ClassInfo* c) {
    for (const auto* base : c->inFileBases) {
      if (mark[base] == Mark::None) { place(base); }
    }
    for (const auto* base : c->inFileBases) {
      if (mark[base] != Mark::Done) {
        mark[c] = Mark::Waiting;
        deferred[base].push_back(c);
        return;
      }
    }
    mark[c] = Mark::Done;
    emission_.push_back(c);
    auto pending = std::move(deferred[c]);
    deferred.erase(c);
    for (const auto* next : pending) { settle(next); }
  };
  place = [&](const ClassInfo* c) {
    if (mark[c] != Mark::None) { return; }
    mark[c] = Mark::InProgress;
    for (const auto* child : c->inner) { place(child); }
    settle(c);
  };

  for (const auto* top : topLevel_) { place(top); }
  for (const auto* info : declared_) {
    if (mark[info] != Mark::Done) {
      failAt(*info->node, "cannot order class '" + info->emittedName + "' after its bases", info->emittedName);
    }
  }
}

LoweringPlan LoweringPlan::build(const ast::File& file, const EmitOptions& options) {
  LoweringPlan plan;
  PlanBuilder builder{plan};
  file.accept(builder);
  plan.resolveBases(file, options);
  plan.checkCycles();
  plan.orderEmission();
  return plan;
}

} // namespace nestport::emit
