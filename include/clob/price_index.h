#pragma once
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "clob/assert.h"
#include "clob/error.h"
#include "clob/types.h"

namespace clob {

// Red-black tree over distinct prices.
//
// Nodes live in an arena addressed by the price itself, so a node's links are
// prices too and EMPTY plays the role of the null pointer. Because price 0 is
// never valid, min()/max()/successor()/predecessor() return EMPTY for "none".
//
// Every operation is O(log n) in the number of distinct price levels, not in
// the number of orders resting at them.

class PriceIndex {
public:
    struct Node {
        Price parent = EMPTY;
        Price left = EMPTY;
        Price right = EMPTY;
        bool red = false;
    };

    Price root() const { return root_; }
    size_t size() const { return nodes_.size(); }
    bool empty() const { return root_ == EMPTY; }

    Price min() const { return root_ == EMPTY ? EMPTY : tree_min(root_); }
    Price max() const { return root_ == EMPTY ? EMPTY : tree_max(root_); }

    // Only the root has no parent, so any other member has a non-empty parent link.
    bool exists(Price price) const {
        if (price == EMPTY) return false;
        if (price == root_) return true;
        auto it = nodes_.find(price);
        return it != nodes_.end() && it->second.parent != EMPTY;
    }

    Price successor(Price price) const {
        require(price);
        const Node& n = node(price);
        if (n.right != EMPTY) return tree_min(n.right);
        Price cursor = n.parent;
        while (cursor != EMPTY && price == node(cursor).right) {
            price = cursor;
            cursor = node(cursor).parent;
        }
        return cursor;
    }

    Price predecessor(Price price) const {
        require(price);
        const Node& n = node(price);
        if (n.left != EMPTY) return tree_max(n.left);
        Price cursor = n.parent;
        while (cursor != EMPTY && price == node(cursor).left) {
            price = cursor;
            cursor = node(cursor).parent;
        }
        return cursor;
    }

    // No-op when the price is already present.
    void insert(Price key) {
        if (key == EMPTY) {
            throw Error(ErrorCode::InvalidPrice, "price index cannot hold price 0");
        }
        if (exists(key)) return;

        Price cursor = EMPTY;
        Price probe = root_;
        while (probe != EMPTY) {
            cursor = probe;
            probe = key < probe ? node(probe).left : node(probe).right;
        }
        nodes_[key] = Node{cursor, EMPTY, EMPTY, true};
        if (cursor == EMPTY) {
            root_ = key;
        } else if (key < cursor) {
            node(cursor).left = key;
        } else {
            node(cursor).right = key;
        }
        insert_fixup(key);
    }

    void remove(Price key) {
        require(key);

        // y is the node physically spliced out: key itself when it has at most
        // one child, otherwise its in-order successor which then takes key's place.
        Price y = key;
        if (node(key).left != EMPTY && node(key).right != EMPTY) {
            y = tree_min(node(key).right);
        }
        Price x = node(y).left != EMPTY ? node(y).left : node(y).right;
        Price x_parent = node(y).parent;
        const bool removed_black = !node(y).red;

        if (x != EMPTY) node(x).parent = x_parent;
        replace_child(x_parent, y, x);

        if (y != key) {
            if (x_parent == key) x_parent = y;
            Node& kn = node(key);
            Node& yn = node(y);
            yn.parent = kn.parent;
            yn.left = kn.left;
            yn.right = kn.right;
            yn.red = kn.red;
            if (yn.left != EMPTY) node(yn.left).parent = y;
            if (yn.right != EMPTY) node(yn.right).parent = y;
            replace_child(kn.parent, key, y);
        }
        nodes_.erase(key);

        if (removed_black) remove_fixup(x, x_parent);
    }

    // Ascending walk, for tests and dumps.
    std::vector<Price> keys() const {
        std::vector<Price> out;
        out.reserve(nodes_.size());
        for (Price p = min(); p != EMPTY; p = successor(p)) out.push_back(p);
        return out;
    }

    // Checks every red-black and link invariant, returns the black height.
    size_t validate() const {
        if (root_ == EMPTY) {
            CLOB_ASSERT(nodes_.empty(), "price index: empty root with live nodes");
            return 0;
        }
        CLOB_ASSERT(!node(root_).red, "price index: red root");
        CLOB_ASSERT(node(root_).parent == EMPTY, "price index: root has a parent");
        size_t visited = 0;
        size_t height = validate_subtree(root_, EMPTY, EMPTY, visited);
        CLOB_ASSERT(visited == nodes_.size(), "price index: unreachable nodes");
        return height;
    }

private:
    std::unordered_map<Price, Node> nodes_;
    Price root_ = EMPTY;

    void require(Price price) const {
        if (!exists(price)) {
            throw Error(ErrorCode::NodeNotFound, "price " + std::to_string(price) + " not in index");
        }
    }

    Node& node(Price price) {
        auto it = nodes_.find(price);
        CLOB_ASSERT(it != nodes_.end(), "price index: dangling link");
        return it->second;
    }

    const Node& node(Price price) const {
        auto it = nodes_.find(price);
        CLOB_ASSERT(it != nodes_.end(), "price index: dangling link");
        return it->second;
    }

    bool is_red(Price price) const { return price != EMPTY && node(price).red; }

    Price tree_min(Price price) const {
        while (node(price).left != EMPTY) price = node(price).left;
        return price;
    }

    Price tree_max(Price price) const {
        while (node(price).right != EMPTY) price = node(price).right;
        return price;
    }

    // Points parent's link that referenced old_child at new_child.
    void replace_child(Price parent, Price old_child, Price new_child) {
        if (parent == EMPTY) {
            root_ = new_child;
            return;
        }
        Node& pn = node(parent);
        if (pn.left == old_child) {
            pn.left = new_child;
        } else {
            CLOB_ASSERT(pn.right == old_child, "price index: parent does not link to child");
            pn.right = new_child;
        }
    }

    void rotate_left(Price x) {
        Node& xn = node(x);
        Price y = xn.right;
        CLOB_ASSERT(y != EMPTY, "price index: rotate_left without right child");
        Node& yn = node(y);
        xn.right = yn.left;
        if (yn.left != EMPTY) node(yn.left).parent = x;
        yn.parent = xn.parent;
        replace_child(xn.parent, x, y);
        yn.left = x;
        xn.parent = y;
    }

    void rotate_right(Price x) {
        Node& xn = node(x);
        Price y = xn.left;
        CLOB_ASSERT(y != EMPTY, "price index: rotate_right without left child");
        Node& yn = node(y);
        xn.left = yn.right;
        if (yn.right != EMPTY) node(yn.right).parent = x;
        yn.parent = xn.parent;
        replace_child(xn.parent, x, y);
        yn.right = x;
        xn.parent = y;
    }

    void insert_fixup(Price z) {
        while (z != root_ && is_red(node(z).parent)) {
            Price p = node(z).parent;
            Price g = node(p).parent;
            CLOB_ASSERT(g != EMPTY, "price index: red node without grandparent");
            if (p == node(g).left) {
                Price uncle = node(g).right;
                if (is_red(uncle)) {
                    node(p).red = false;
                    node(uncle).red = false;
                    node(g).red = true;
                    z = g;
                } else {
                    if (z == node(p).right) {
                        z = p;
                        rotate_left(z);
                        p = node(z).parent;
                    }
                    node(p).red = false;
                    node(g).red = true;
                    rotate_right(g);
                }
            } else {
                Price uncle = node(g).left;
                if (is_red(uncle)) {
                    node(p).red = false;
                    node(uncle).red = false;
                    node(g).red = true;
                    z = g;
                } else {
                    if (z == node(p).left) {
                        z = p;
                        rotate_right(z);
                        p = node(z).parent;
                    }
                    node(p).red = false;
                    node(g).red = true;
                    rotate_left(g);
                }
            }
        }
        node(root_).red = false;
    }

    // x may be EMPTY (a null leaf carrying the extra black), hence the explicit parent.
    void remove_fixup(Price x, Price parent) {
        while (x != root_ && !is_red(x)) {
            if (x == node(parent).left) {
                Price w = node(parent).right;
                CLOB_ASSERT(w != EMPTY, "price index: black-height violated on delete");
                if (is_red(w)) {
                    node(w).red = false;
                    node(parent).red = true;
                    rotate_left(parent);
                    w = node(parent).right;
                }
                if (!is_red(node(w).left) && !is_red(node(w).right)) {
                    node(w).red = true;
                    x = parent;
                    parent = node(x).parent;
                } else {
                    if (!is_red(node(w).right)) {
                        node(node(w).left).red = false;
                        node(w).red = true;
                        rotate_right(w);
                        w = node(parent).right;
                    }
                    node(w).red = node(parent).red;
                    node(parent).red = false;
                    if (node(w).right != EMPTY) node(node(w).right).red = false;
                    rotate_left(parent);
                    x = root_;
                    parent = EMPTY;
                }
            } else {
                Price w = node(parent).left;
                CLOB_ASSERT(w != EMPTY, "price index: black-height violated on delete");
                if (is_red(w)) {
                    node(w).red = false;
                    node(parent).red = true;
                    rotate_right(parent);
                    w = node(parent).left;
                }
                if (!is_red(node(w).right) && !is_red(node(w).left)) {
                    node(w).red = true;
                    x = parent;
                    parent = node(x).parent;
                } else {
                    if (!is_red(node(w).left)) {
                        node(node(w).right).red = false;
                        node(w).red = true;
                        rotate_left(w);
                        w = node(parent).left;
                    }
                    node(w).red = node(parent).red;
                    node(parent).red = false;
                    if (node(w).left != EMPTY) node(node(w).left).red = false;
                    rotate_right(parent);
                    x = root_;
                    parent = EMPTY;
                }
            }
        }
        if (x != EMPTY) node(x).red = false;
    }

    // lo/hi are exclusive bounds (EMPTY = unbounded).
    size_t validate_subtree(Price p, Price lo, Price hi, size_t& visited) const {
        if (p == EMPTY) return 1;
        ++visited;
        const Node& n = node(p);
        CLOB_ASSERT(lo == EMPTY || p > lo, "price index: in-order violation");
        CLOB_ASSERT(hi == EMPTY || p < hi, "price index: in-order violation");
        if (n.red) {
            CLOB_ASSERT(!is_red(n.left) && !is_red(n.right), "price index: red node with red child");
        }
        if (n.left != EMPTY) CLOB_ASSERT(node(n.left).parent == p, "price index: left child parent link");
        if (n.right != EMPTY) CLOB_ASSERT(node(n.right).parent == p, "price index: right child parent link");
        size_t lh = validate_subtree(n.left, lo, p, visited);
        size_t rh = validate_subtree(n.right, p, hi, visited);
        CLOB_ASSERT(lh == rh, "price index: unequal black height");
        return lh + (n.red ? 0 : 1);
    }
};

} // namespace clob
