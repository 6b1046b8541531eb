#ifndef STRUTGRID_QUAD_MESH_HXX
#define STRUTGRID_QUAD_MESH_HXX

#include "Vec3.hxx"

#include <array>
#include <cstddef>
#include <utility>
#include <vector>

// Quad mesh in world space: the mesh sink of the slab grid.
// All members are public for direct access; helper static inline functions provided.
class QuadMesh {
public:
    // Counts
    int nv = 0;            // number of vertices
    int nfaces = 0;        // number of quads

    // Geometry and topology
    std::vector<Point3> verts;                 // vertex coordinates
    std::vector<std::array<int,4>> faces;      // quad to vertex indices (CCW about the normal)
    std::vector<Point3> normals;               // per vertex, filled by computeNormals()

    // Derived connectivity, filled by buildConnectivity()
    std::vector<std::array<int,2>> edges;      // unique undirected edges (low, high)
    std::vector<std::array<int,4>> faceEdges;  // per face: edges (v0,v1),(v1,v2),(v2,v3),(v3,v0)
    std::vector<std::array<int,2>> edgeFaces;  // per edge: adjacent faces (second = -1 if boundary)
    std::vector<std::vector<int>> vertexFaces; // vertex -> incident faces
    std::vector<int> vbdy;                     // vertices on boundary edges, ascending
    std::vector<double> areas;                 // per face

    int addVertex(const Point3& p);

    // Throws std::runtime_error for out-of-range or repeated vertex indices
    int addQuad(int a, int b, int c, int d);

    // Area-weighted vertex normals; vertices without faces get a zero normal
    void computeNormals();

    // Drop vertices no face references and reindex faces. Connectivity is cleared.
    // Returns the number of removed vertices.
    int compact();

    void buildConnectivity();

    double totalArea() const;

    // Static inline helpers -------------------------------------------------
    // Planar quad: half the cross product of the diagonals
    static inline Point3 quadNormal(const Point3& a, const Point3& b,
                                    const Point3& c, const Point3& d) {
        return Vec3::scale(Vec3::cross(Vec3::sub(c, a), Vec3::sub(d, b)), 0.5);
    }

    static inline double quadArea(const Point3& a, const Point3& b,
                                  const Point3& c, const Point3& d) {
        return Vec3::norm(quadNormal(a, b, c, d));
    }

    static inline std::array<int,2> makeEdge(int v0, int v1) {
        if (v0 < v1) return {v0,v1};
        return {v1,v0};
    }

    // Key for hashing undirected edge (a,b) with a<b into 64-bit (assuming 32-bit ints)
    static inline long long edgeKeyPair(int a, int b) {
        if (a > b) std::swap(a,b);
        return (static_cast<long long>(a) << 32) | static_cast<long long>(b);
    }

    void clear();

private:
    void clearConnectivity();
};

#endif // STRUTGRID_QUAD_MESH_HXX
