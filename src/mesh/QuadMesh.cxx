#include "QuadMesh.hxx"

#include <stdexcept>
#include <string>
#include <unordered_map>

void QuadMesh::clear() {
    nv = 0; nfaces = 0;
    verts.clear(); faces.clear(); normals.clear();
    clearConnectivity();
}

void QuadMesh::clearConnectivity() {
    edges.clear(); faceEdges.clear(); edgeFaces.clear(); vertexFaces.clear(); vbdy.clear(); areas.clear();
}

int QuadMesh::addVertex(const Point3& p) {
    verts.push_back(p);
    nv = static_cast<int>(verts.size());
    return nv - 1;
}

int QuadMesh::addQuad(int a, int b, int c, int d) {
    const int v[4] = {a, b, c, d};
    for (int i = 0; i < 4; ++i) {
        if (v[i] < 0 || v[i] >= nv) {
            throw std::runtime_error("addQuad: vertex index " + std::to_string(v[i]) + " out of range");
        }
        for (int j = 0; j < i; ++j) {
            if (v[i] == v[j]) throw std::runtime_error("addQuad: repeated vertex index " + std::to_string(v[i]));
        }
    }
    faces.push_back({a, b, c, d});
    nfaces = static_cast<int>(faces.size());
    return nfaces - 1;
}

void QuadMesh::computeNormals() {
    normals.assign(verts.size(), Point3{0.0, 0.0, 0.0});
    for (const auto& f : faces) {
        // weighted by area through the unnormalized diagonal cross product
        const Point3 n = quadNormal(verts[static_cast<std::size_t>(f[0])], verts[static_cast<std::size_t>(f[1])],
                                    verts[static_cast<std::size_t>(f[2])], verts[static_cast<std::size_t>(f[3])]);
        for (int k = 0; k < 4; ++k) {
            auto& acc = normals[static_cast<std::size_t>(f[k])];
            acc = Vec3::add(acc, n);
        }
    }
    for (auto& n : normals) {
        Point3 unit;
        n = Vec3::normalized(n, unit) ? unit : Point3{0.0, 0.0, 0.0};
    }
}

int QuadMesh::compact() {
    std::vector<int> remap(verts.size(), -1);
    for (const auto& f : faces) {
        for (int v : f) remap[static_cast<std::size_t>(v)] = 0;
    }
    const bool haveNormals = normals.size() == verts.size();
    std::vector<Point3> keptVerts, keptNormals;
    keptVerts.reserve(verts.size());
    for (std::size_t i = 0; i < verts.size(); ++i) {
        if (remap[i] < 0) continue;
        remap[i] = static_cast<int>(keptVerts.size());
        keptVerts.push_back(verts[i]);
        if (haveNormals) keptNormals.push_back(normals[i]);
    }
    const int removed = nv - static_cast<int>(keptVerts.size());
    for (auto& f : faces) {
        for (int& v : f) v = remap[static_cast<std::size_t>(v)];
    }
    verts.swap(keptVerts);
    if (haveNormals) normals.swap(keptNormals); else normals.clear();
    nv = static_cast<int>(verts.size());
    clearConnectivity();
    return removed;
}

void QuadMesh::buildConnectivity() {
    clearConnectivity();

    areas.resize(faces.size());
    for (std::size_t i = 0; i < faces.size(); ++i) {
        const auto& f = faces[i];
        areas[i] = quadArea(verts[static_cast<std::size_t>(f[0])], verts[static_cast<std::size_t>(f[1])],
                            verts[static_cast<std::size_t>(f[2])], verts[static_cast<std::size_t>(f[3])]);
    }

    std::unordered_map<long long,int> edgeKeyToIndex;
    faceEdges.resize(faces.size());
    for (std::size_t fi = 0; fi < faces.size(); ++fi) {
        const auto& quad = faces[fi];
        for (int epos = 0; epos < 4; ++epos) {
            const int a = quad[static_cast<std::size_t>(epos)];
            const int b = quad[static_cast<std::size_t>((epos + 1) % 4)];
            const long long key = edgeKeyPair(a, b);
            auto it = edgeKeyToIndex.find(key);
            int eIdx;
            if (it == edgeKeyToIndex.end()) {
                eIdx = static_cast<int>(edges.size());
                edges.push_back(makeEdge(a, b));
                edgeKeyToIndex.emplace(key, eIdx);
                edgeFaces.push_back({static_cast<int>(fi), -1});
            } else {
                eIdx = it->second;
                // Non-manifold edge keeps the last face (grid meshes never produce one)
                edgeFaces[static_cast<std::size_t>(eIdx)][1] = static_cast<int>(fi);
            }
            faceEdges[fi][static_cast<std::size_t>(epos)] = eIdx;
        }
    }

    std::vector<char> isBdy(static_cast<std::size_t>(nv), 0);
    for (std::size_t ei = 0; ei < edgeFaces.size(); ++ei) {
        if (edgeFaces[ei][1] == -1) {
            isBdy[static_cast<std::size_t>(edges[ei][0])] = 1;
            isBdy[static_cast<std::size_t>(edges[ei][1])] = 1;
        }
    }
    for (int i = 0; i < nv; ++i) if (isBdy[static_cast<std::size_t>(i)]) vbdy.push_back(i);

    vertexFaces.resize(static_cast<std::size_t>(nv));
    for (int fi = 0; fi < nfaces; ++fi) {
        for (int v : faces[static_cast<std::size_t>(fi)]) vertexFaces[static_cast<std::size_t>(v)].push_back(fi);
    }
}

double QuadMesh::totalArea() const {
    double sum = 0.0;
    for (const auto& f : faces) {
        sum += quadArea(verts[static_cast<std::size_t>(f[0])], verts[static_cast<std::size_t>(f[1])],
                        verts[static_cast<std::size_t>(f[2])], verts[static_cast<std::size_t>(f[3])]);
    }
    return sum;
}
