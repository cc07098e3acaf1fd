#ifndef VOXLINK_REMOTE_POOL_H
#define VOXLINK_REMOTE_POOL_H

#include "voxlink/remote/node.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace voxlink::remote
{

class Pool
{
    std::mutex n_m;
    std::vector<std::unique_ptr<Node> > nodes;

  public:
    Pool ();
    ~Pool ();

    /**
     * @brief Take ownership of node
     *
     * @return Node* The added node
     * @throw voxlink::exception A node with the same identifier exists
     */
    Node *add_node (std::unique_ptr<Node> node);

    /**
     * @brief Get the node with the fewest registered players, the first
     * added wins ties
     *
     * @return Node* nullptr if the pool is empty
     */
    Node *get_node ();

    /**
     * @brief Get node by identifier, nullptr if not found
     */
    Node *get_node (const std::string &identifier);

    std::vector<Node *> get_nodes ();

    size_t size ();
};

} // voxlink::remote

#endif // VOXLINK_REMOTE_POOL_H
