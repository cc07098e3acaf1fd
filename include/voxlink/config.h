#ifndef VOXLINK_CONFIG_H
#define VOXLINK_CONFIG_H

// config file read when VOXLINK_CONFIG isn't set in the environment
#define VOXLINK_DEFAULT_CONFIG_FILE "vx_conf.json"

// seconds
#define VOXLINK_DEFAULT_CONNECT_TIMEOUT 5.0

#define VOXLINK_DEFAULT_VOLUME 100
#define VOXLINK_MIN_VOLUME 0
#define VOXLINK_MAX_VOLUME 1000

// sent as Client-Name header to remote nodes
#define VOXLINK_CLIENT_NAME "voxlink/1.0"

#endif // VOXLINK_CONFIG_H
