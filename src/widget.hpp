#pragma once
/*
 * Widgets
 *
 * Purpose: value-type render tree rebuilt every frame.
 *   Text      - leaf; optional centering, border and border title.
 *   Container - owns boxed children and gives each an equal share of its area.
 * Constraint: widgets draw only through ITerminal and only inside the area they are given.
 */
#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "iterminal.hpp"
#include "layout.hpp"
#include "text_width.hpp"

class IWidget {
public:
  virtual ~IWidget() = default;
  virtual void render(const Rect& area, ITerminal& term) const = 0;
};

struct TextOptions {
  bool centered = false;
  bool bordered = false;
  std::optional<std::string> border_title;
  int color = 0; // ColorPair id, 0 = terminal default
};

class Text : public IWidget {
public:
  explicit Text(std::string content, TextOptions opts = {});
  void render(const Rect& area, ITerminal& term) const override;
  const std::string& content() const { return content_; }

private:
  void draw_line(ITerminal& term, int row, int col, const std::string& s) const;
  std::string content_;
  TextOptions opts_;
};

template <typename T>
  requires std::derived_from<T, IWidget>
class Container : public IWidget {
public:
  explicit Container(Axis axis = Axis::Horizontal) : axis_(axis) {}

  template <typename W = T, typename... Args>
  W& emplace(Args&&... args) {
    auto w = std::make_unique<W>(std::forward<Args>(args)...);
    W& ref = *w;
    children_.push_back(std::move(w));
    return ref;
  }

  int size() const { return static_cast<int>(children_.size()); }
  Axis axis() const { return axis_; }
  std::vector<Rect> regions(const Rect& area) const { return split_even(area, size(), axis_); }

  void render(const Rect& area, ITerminal& term) const override {
    std::vector<Rect> rs = regions(area);
    for (size_t i = 0; i < children_.size(); ++i) children_[i]->render(rs[i], term);
  }

private:
  Axis axis_;
  std::vector<std::unique_ptr<T>> children_;
};
