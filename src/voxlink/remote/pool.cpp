#include "voxlink/remote/pool.h"

namespace voxlink::remote
{

Pool::Pool () = default;

Pool::~Pool () = default;

Node *
Pool::add_node (std::unique_ptr<Node> node)
{
    if (!node)
        throw exception ("Can't add null node");

    std::lock_guard lk (this->n_m);

    for (const auto &n : this->nodes)
        {
            if (n->get_identifier () == node->get_identifier ())
                throw exception ("Node '" + node->get_identifier ()
                                 + "' already exists");
        }

    Node *added = node.get ();
    this->nodes.push_back (std::move (node));

    return added;
}

Node *
Pool::get_node ()
{
    std::lock_guard lk (this->n_m);

    Node *least = nullptr;
    size_t least_count = 0;

    for (const auto &n : this->nodes)
        {
            const size_t count = n->player_count ();

            if (least && count >= least_count)
                continue;

            least = n.get ();
            least_count = count;
        }

    return least;
}

Node *
Pool::get_node (const std::string &identifier)
{
    std::lock_guard lk (this->n_m);

    for (const auto &n : this->nodes)
        {
            if (n->get_identifier () == identifier)
                return n.get ();
        }

    return nullptr;
}

std::vector<Node *>
Pool::get_nodes ()
{
    std::lock_guard lk (this->n_m);

    std::vector<Node *> ret;
    ret.reserve (this->nodes.size ());

    for (const auto &n : this->nodes)
        ret.push_back (n.get ());

    return ret;
}

size_t
Pool::size ()
{
    std::lock_guard lk (this->n_m);
    return this->nodes.size ();
}

} // voxlink::remote
